// 回放步骤定义：引擎和深度排序都可以顺带产出一份可读的步骤日志
#pragma once
#include <QString>
#include <string>
#include <type_traits>
#include <vector>

enum class StepType {
    Visit, PushStack, PopStack,
    AssignSCC,
    BuildCondensedEdge,
    DepthInit,
    DepthRelax,
    DepthEmit
};

struct Step {
    StepType type;
    long long u = -1;  // 顶点的发现序号 / 分量下标
    long long v = -1;
    long long scc = -1; // AssignSCC 时用
    long long val = 0;  // 例如深度的新值
    QString note;       // 日志文本
};

using StepList = std::vector<Step>;

QString stepTypeName(StepType type);

// 顶点转成日志里的名字；认不出的类型退回到发现序号
template <typename V>
QString vertexLabel(const V& v, long long discoveryIndex)
{
    if constexpr (std::is_same_v<V, bool>) {
        return v ? QStringLiteral("true") : QStringLiteral("false");
    } else if constexpr (std::is_integral_v<V>) {
        return QString::number(static_cast<long long>(v));
    } else if constexpr (std::is_same_v<V, QString>) {
        return v;
    } else if constexpr (std::is_same_v<V, std::string>) {
        return QString::fromStdString(v);
    } else {
        return QString("#%1").arg(discoveryIndex);
    }
}

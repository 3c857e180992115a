// 输出模块：把计算结果整理成文本
#pragma once
#include "Components.h"
#include "DepthOrder.h"
#include "Steps.h"
#include <QString>
#include <QStringList>

QString formatIndexSet(const IndexSet& set); // 升序输出，保证结果稳定
QString formatCondensation(const Condensation& dag);
QString formatDirectSuccessors(const Condensation& dag);
QString formatDepthOrder(const DepthResult& res);
QString formatSteps(const StepList& steps);

template <typename V>
QString formatComponents(const Components<V>& comps)
{
    QStringList lines;
    std::size_t i = 0;
    for (const auto& component : comps) {
        // 不能直接打印的顶点类型按分量内的位置编号
        QStringList names;
        long long pos = 0;
        for (const auto& v : component) names << vertexLabel(v, pos++);

        QString line = QString("SCC%1 (%2)").arg(i).arg(component.size());
        if (comps.isCyclic(i).value_or(false)) line += " cyclic";
        line += ": " + names.join(' ');
        lines << line;
        ++i;
    }
    return lines.join('\n');
}

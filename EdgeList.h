// 输入模块：批量边文本（每行 "u v"）
#pragma once
#include <QString>
#include <QStringList>
#include <utility>
#include <vector>

// 下标模式允许的点数上限：下标必须 < kMaxIndexVertices
constexpr int kMaxIndexVertices = 1 << 20;

struct EdgeListResult {
    std::vector<std::pair<QString, QString>> edges;
    QStringList vertices;  // 按首次出现的顺序，包括单独一行声明的孤立点
    int vertexCount = 0;   // 下标模式：最大下标 + 1
    int skippedLines = 0;
};

// 空行和 # 开头的行忽略；只有一个 token 的行声明孤立点；多余的 token 忽略。
// indices=true 时 token 必须是 [0, kMaxIndexVertices) 内的整数，否则整行跳过并计数。
EdgeListResult parseEdgeList(const QString& text, bool indices = false);

// 读不到文件时 *ok=false，返回空结果
EdgeListResult loadEdgeListFile(const QString& path, bool indices, bool* ok);

#include "EdgeList.h"
#include "Logging.h"
#include <QFile>
#include <QRegularExpression>
#include <QSet>
#include <QTextStream>
#include <algorithm>

EdgeListResult parseEdgeList(const QString& text, bool indices)
{
    EdgeListResult res;
    QSet<QString> seen;

    auto remember = [&res, &seen, indices](const QString& v) {
        if (indices) res.vertexCount = std::max(res.vertexCount, v.toInt() + 1);
        if (!seen.contains(v)) {
            seen.insert(v);
            res.vertices.append(v);
        }
    };

    auto validIndex = [](const QString& token) {
        bool ok = false;
        const int value = token.toInt(&ok);
        return ok && value >= 0 && value < kMaxIndexVertices;
    };

    static const QRegularExpression ws("\\s+");
    const auto lines = text.split('\n');
    for (int lineNo = 0; lineNo < lines.size(); ++lineNo) {
        const QString line = lines[lineNo].trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;

        auto parts = line.split(ws, Qt::SkipEmptyParts);
        while (parts.size() > 2) parts.removeLast();

        if (indices && !std::all_of(parts.begin(), parts.end(), validIndex)) {
            res.skippedLines++;
            qCWarning(lcInput) << "line" << lineNo + 1 << "skipped, not a vertex index:" << line;
            continue;
        }

        if (indices) {
            // "007" 和 "7" 是同一个点
            for (auto& p : parts) p = QString::number(p.toInt());
        }

        for (const auto& p : parts) remember(p);
        if (parts.size() == 2) res.edges.emplace_back(parts[0], parts[1]);
    }

    qCDebug(lcInput) << "parsed" << res.edges.size() << "edges over" << res.vertices.size()
                     << "vertices," << res.skippedLines << "lines skipped";
    return res;
}

EdgeListResult loadEdgeListFile(const QString& path, bool indices, bool* ok)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCCritical(lcInput) << "cannot open" << path << ":" << file.errorString();
        if (ok) *ok = false;
        return {};
    }

    QTextStream in(&file);
    if (ok) *ok = true;
    return parseEdgeList(in.readAll(), indices);
}

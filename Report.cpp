#include "Report.h"
#include <algorithm>
#include <vector>

QString formatIndexSet(const IndexSet& set)
{
    std::vector<std::size_t> sorted(set.begin(), set.end());
    std::sort(sorted.begin(), sorted.end());

    QStringList names;
    for (std::size_t i : sorted) names << QString("SCC%1").arg(i);
    return "{" + names.join(", ") + "}";
}

QString formatCondensation(const Condensation& dag)
{
    QStringList lines;
    for (std::size_t i = 0; i < dag.size(); ++i) {
        std::vector<std::size_t> targets(dag.edges()[i].begin(), dag.edges()[i].end());
        std::sort(targets.begin(), targets.end());
        for (std::size_t j : targets) {
            if (j == i) continue;
            lines << QString("SCC%1 -> SCC%2").arg(i).arg(j);
        }
    }
    return lines.join('\n');
}

QString formatDirectSuccessors(const Condensation& dag)
{
    QStringList lines;
    for (std::size_t i = 0; i < dag.size(); ++i) {
        lines << QString("SCC%1 => %2").arg(i).arg(formatIndexSet(*dag.directSuccessors(i)));
    }
    return lines.join('\n');
}

QString formatDepthOrder(const DepthResult& res)
{
    if (!res.ok) return QStringLiteral("depth order unavailable: condensation has a cycle");

    QStringList lines;
    for (std::size_t c : res.order) {
        lines << QString("depth %1: SCC%2").arg(res.depth[c]).arg(c);
    }
    return lines.join('\n');
}

QString formatSteps(const StepList& steps)
{
    QStringList lines;
    int n = 0;
    for (const auto& s : steps) {
        lines << QString("%1. [%2] %3").arg(++n, 4).arg(stepTypeName(s.type), -11).arg(s.note);
    }
    return lines.join('\n');
}

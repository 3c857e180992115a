#include "DepthOrder.h"
#include "EdgeList.h"
#include "Graph.h"
#include "Logging.h"
#include "Report.h"
#include "TarjanSCC.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include <string>

namespace {

struct Options {
    bool dag = false;
    bool direct = false;
    bool order = false;
    bool trace = false;
};

template <typename G>
void analyze(const G& g, const Options& opt, QTextStream& out)
{
    TarjanSCC<G> algo;
    algo.setRecordSteps(opt.trace);
    const auto comps = algo.run(g);

    qCInfo(lcScc) << "found" << comps.size() << "components";

    out << "# components\n" << formatComponents(comps) << '\n';

    if (opt.dag) out << "# condensation\n" << formatCondensation(comps.condensation()) << '\n';
    if (opt.direct) out << "# direct successors\n" << formatDirectSuccessors(comps.condensation()) << '\n';

    DepthResult depth;
    if (opt.order || opt.trace) {
        DepthOrder algoDepth;
        depth = algoDepth.run(comps.condensation());
        if (!depth.ok) qCWarning(lcScc) << "depth relaxation did not converge";
    }
    if (opt.order) out << "# depth order\n" << formatDepthOrder(depth) << '\n';

    if (opt.trace) {
        StepList steps = algo.steps();
        steps.insert(steps.end(), depth.steps.begin(), depth.steps.end());
        out << "# steps\n" << formatSteps(steps) << '\n';
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sccdepth");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Strongly connected components, condensation and depth ordering of a directed graph.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", "Edge list, one \"u v\" per line. Reads stdin when omitted.", "[file]");

    QCommandLineOption indexOpt({"i", "index"}, "Vertices are integer indices 0..n-1.");
    QCommandLineOption dagOpt({"d", "dag"}, "Print condensation edges.");
    QCommandLineOption directOpt("direct", "Print direct successors of every component.");
    QCommandLineOption orderOpt({"o", "order"}, "Print components ordered by depth.");
    QCommandLineOption traceOpt({"t", "trace"}, "Print the step log of the traversal.");
    QCommandLineOption verboseOpt({"V", "verbose"}, "Enable debug logging.");
    parser.addOptions({indexOpt, dagOpt, directOpt, orderOpt, traceOpt, verboseOpt});

    if (!parser.parse(app.arguments())) {
        qCCritical(lcApp).noquote() << parser.errorText();
        return 2;
    }
    if (parser.isSet("help")) parser.showHelp(0);
    if (parser.isSet("version")) parser.showVersion();

    if (parser.isSet(verboseOpt)) QLoggingCategory::setFilterRules("sccdepth.*.debug=true");

    const QStringList args = parser.positionalArguments();
    if (args.size() > 1) {
        qCCritical(lcApp) << "expected at most one input file, got" << args.size();
        return 2;
    }

    const bool indices = parser.isSet(indexOpt);
    EdgeListResult input;
    if (args.isEmpty()) {
        QTextStream in(stdin);
        input = parseEdgeList(in.readAll(), indices);
    } else {
        bool ok = false;
        input = loadEdgeListFile(args.first(), indices, &ok);
        if (!ok) return 1;
    }
    if (input.skippedLines > 0) {
        qCWarning(lcInput) << input.skippedLines << "lines skipped";
    }

    Options opt;
    opt.dag = parser.isSet(dagOpt);
    opt.direct = parser.isSet(directOpt);
    opt.order = parser.isSet(orderOpt);
    opt.trace = parser.isSet(traceOpt);

    QTextStream out(stdout);

    if (indices) {
        Graph g(input.vertexCount);
        int duplicates = 0;
        int outOfRange = 0;
        for (const auto& [u, v] : input.edges) {
            const int a = u.toInt();
            const int b = v.toInt();
            if (a < 0 || a >= g.n || b < 0 || b >= g.n) {
                outOfRange++;
                qCWarning(lcInput) << "edge" << u << "->" << v << "dropped, index out of range";
                continue;
            }
            if (!g.addEdge(a, b)) duplicates++;
        }
        if (outOfRange > 0) qCWarning(lcInput) << outOfRange << "edges dropped";
        qCDebug(lcInput) << "graph: n=" << g.n << "edges=" << g.edges.size() << "duplicates=" << duplicates;
        analyze(g, opt, out);
    } else {
        KeyedGraph<std::string> g;
        for (const auto& v : input.vertices) g.addVertex(v.toStdString());
        int duplicates = 0;
        for (const auto& [u, v] : input.edges) {
            if (!g.addEdge(u.toStdString(), v.toStdString())) duplicates++;
        }
        qCDebug(lcInput) << "graph: n=" << g.size() << "duplicates=" << duplicates;
        analyze(g, opt, out);
    }

    out.flush();
    return 0;
}

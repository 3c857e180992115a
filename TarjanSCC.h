// algo/TarjanSCC.h
#pragma once
#include "Components.h"
#include "Condense.h"
#include "Steps.h"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// G 只要提供 vertices() 和 successors(v)，两者都返回可遍历的顶点序列
template <typename G>
using GraphVertex = std::decay_t<decltype(*std::begin(std::declval<const G&>().vertices()))>;

template <typename G>
class TarjanSCC {
public:
    using Vertex = GraphVertex<G>;
    using Result = Components<Vertex>;

    // 开启后 run() 顺带记录回放步骤，不影响结果
    void setRecordSteps(bool on) { recordSteps = on; }
    const StepList& steps() const { return stepList; }

    Result run(const G& g);

private:
    struct Data {
        long long index;
        long long lowlink;
        bool onStack;
        std::size_t component;
    };

    // 显式栈代替递归：next 指向下一个要看的后继
    struct Frame {
        Vertex v;
        Data* data;
        std::vector<Vertex> succ;
        std::size_t next = 0;
    };

    bool recordSteps = false;
    long long timer = 0;

    std::unordered_map<Vertex, Data> map; // unordered_map 扩容不会让元素引用失效
    std::vector<Vertex> st;
    std::vector<Frame> frames;
    std::vector<std::vector<Vertex>> list;
    StepList stepList;

    void strongConnect(const G& g, const Vertex& root);
    void open(const G& g, const Vertex& v);
    void finish(const Vertex& v);
};

template <typename G>
typename TarjanSCC<G>::Result TarjanSCC<G>::run(const G& g)
{
    timer = 0;
    map.clear();
    st.clear();
    frames.clear();
    list.clear();
    stepList.clear();

    for (const auto& v : g.vertices()) {
        if (map.find(v) == map.end()) strongConnect(g, v);
    }

    // 发现记录只在遍历期间有用，结束后折叠成 顶点 -> 分量 的映射
    std::unordered_map<Vertex, std::size_t> sccId;
    sccId.reserve(map.size());
    for (const auto& [v, data] : map) sccId.emplace(v, data.component);
    map.clear();

    Condense condense;
    CondenseResult cond = condense.run(g, list, sccId, recordSteps);
    if (recordSteps) {
        stepList.insert(stepList.end(),
                        std::make_move_iterator(cond.steps.begin()),
                        std::make_move_iterator(cond.steps.end()));
    }

    return Result(std::move(list), std::move(sccId), std::move(cond.dag));
}

template <typename G>
void TarjanSCC<G>::strongConnect(const G& g, const Vertex& root)
{
    open(g, root);

    while (!frames.empty()) {
        Frame& f = frames.back();

        if (f.next < f.succ.size()) {
            const Vertex w = f.succ[f.next++];
            auto it = map.find(w);
            if (it == map.end()) {
                open(g, w); // 相当于递归 dfs(w)，f 之后不能再用
            } else if (it->second.onStack) {
                // 注意这里用的是 w 的 index 而不是 lowlink，和原论文一致
                f.data->lowlink = std::min(f.data->lowlink, it->second.index);
            }
            // 不在栈里：w 所在的分量已经完成，这条边只进缩点图
            continue;
        }

        Vertex v = std::move(f.v);
        Data* d = f.data;
        frames.pop_back();

        if (d->lowlink == d->index) finish(v);

        if (!frames.empty()) {
            Data* parent = frames.back().data;
            parent->lowlink = std::min(parent->lowlink, d->lowlink);
        }
    }
}

template <typename G>
void TarjanSCC<G>::open(const G& g, const Vertex& v)
{
    const long long index = timer++;
    Data& d = map.emplace(v, Data{index, index, true, 0}).first->second;
    st.push_back(v);

    if (recordSteps) {
        const QString name = vertexLabel(v, index);
        stepList.push_back({StepType::Visit, index, -1, -1, 0, QString("访问 %1").arg(name)});
        stepList.push_back({StepType::PushStack, index, -1, -1, 0, QString("入栈 %1").arg(name)});
    }

    Frame f{v, &d, {}, 0};
    for (const auto& w : g.successors(v)) f.succ.push_back(w);
    frames.push_back(std::move(f));
}

template <typename G>
void TarjanSCC<G>::finish(const Vertex& v)
{
    const std::size_t id = list.size();
    std::vector<Vertex> component;

    while (true) {
        Vertex x = st.back();
        st.pop_back();

        Data& dx = map.at(x);
        dx.onStack = false;
        dx.component = id;

        if (recordSteps) {
            const QString name = vertexLabel(x, dx.index);
            stepList.push_back({StepType::PopStack, dx.index, -1, -1, 0, QString("弹出 %1").arg(name)});
            stepList.push_back({StepType::AssignSCC, dx.index, -1, static_cast<long long>(id), 0,
                                QString("添加节点 %1 到 SCC %2").arg(name, QString::number(id))});
        }

        const bool isRoot = (x == v);
        component.push_back(std::move(x));
        if (isRoot) break;
    }

    list.push_back(std::move(component));
}

#include <pinfold/graph.hpp>

#include <algorithm>
#include <set>
#include <sstream>
#include <unordered_set>

namespace pinfold {

size_t DependencyGraph::add_node(const std::string& key) {
    auto [it, inserted] = index_.emplace(key, nodes_.size());
    if (inserted) nodes_.push_back(Node{key, {}, {}});
    return it->second;
}

void DependencyGraph::add_edge(const std::string& user, const std::string& dep) {
    size_t u = add_node(user);
    size_t d = add_node(dep);
    auto& deps = nodes_[u].deps;
    if (std::find(deps.begin(), deps.end(), d) != deps.end()) return;
    deps.push_back(d);
    nodes_[d].users.push_back(u);
}

const DependencyGraph::Node* DependencyGraph::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

std::vector<std::string> DependencyGraph::keys_of(const std::vector<size_t>& ids) const {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (size_t id : ids) out.push_back(nodes_[id].key);
    return out;
}

std::vector<std::string> DependencyGraph::dependencies(const std::string& key) const {
    const Node* node = find(key);
    return node ? keys_of(node->deps) : std::vector<std::string>{};
}

std::vector<std::string> DependencyGraph::dependents(const std::string& key) const {
    const Node* node = find(key);
    return node ? keys_of(node->users) : std::vector<std::string>{};
}

Result<std::vector<std::string>> DependencyGraph::dependency_order() const {
    // Leaves first: a node is ready once every dependency has been emitted
    std::vector<size_t> waiting(nodes_.size());
    std::set<size_t> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        waiting[i] = nodes_[i].deps.size();
        if (waiting[i] == 0) ready.insert(i);
    }

    std::vector<size_t> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (size_t user : nodes_[next].users) {
            if (--waiting[user] == 0) ready.insert(user);
        }
    }

    if (order.size() != nodes_.size()) {
        return PinfoldError{PinfoldError::Cycle, "graph contains a cycle"};
    }
    return Result<std::vector<std::string>>::ok(keys_of(order));
}

std::string DependencyGraph::render_tree(const std::string& root, const Label& label,
                                         const std::string& indent) const {
    auto it = index_.find(root);
    if (it == index_.end()) return "";

    std::ostringstream out;
    std::unordered_set<size_t> shown;

    // `branch` is the connector column for this node, `rail` what its
    // children inherit from the levels above
    std::function<void(size_t, const std::string&, const std::string&)> walk =
        [&](size_t id, const std::string& branch, const std::string& rail) {
            out << indent << branch << label(nodes_[id].key);
            if (!shown.insert(id).second) {
                out << " (*)\n";
                return;
            }
            out << '\n';
            const auto& deps = nodes_[id].deps;
            for (size_t i = 0; i < deps.size(); ++i) {
                bool last = i + 1 == deps.size();
                walk(deps[i], rail + (last ? "└── " : "├── "),
                     rail + (last ? "    " : "│   "));
            }
        };
    walk(it->second, "", " ");
    return out.str();
}

} // namespace pinfold

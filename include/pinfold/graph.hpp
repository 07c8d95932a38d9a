#pragma once

#include <pinfold/result.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pinfold {

// String-keyed dependency DAG. Keys are package names during concretization
// and content hashes once specs are concrete. An edge `user -> dep` records
// that `user` links against `dep`.
class DependencyGraph {
public:
    using Label = std::function<std::string(const std::string& key)>;

    // Adds `key` if it is new; returns its insertion index either way
    size_t add_node(const std::string& key);
    // Adds both endpoints as needed. Repeated edges are kept once.
    void add_edge(const std::string& user, const std::string& dep);

    bool contains(const std::string& key) const { return index_.count(key) > 0; }
    size_t size() const { return nodes_.size(); }
    const std::string& key(size_t index) const { return nodes_[index].key; }

    // Direct neighbours in insertion order. Unknown keys have none.
    std::vector<std::string> dependencies(const std::string& key) const;
    std::vector<std::string> dependents(const std::string& key) const;

    // Every key after all of its dependencies. Among keys that are ready at
    // the same time the earliest inserted goes first.
    Result<std::vector<std::string>> dependency_order() const;
    bool has_cycle() const { return dependency_order().is_err(); }

    // Indented tree below `root`; a node met a second time is printed once
    // more with " (*)" and not expanded.
    std::string render_tree(const std::string& root, const Label& label,
                            const std::string& indent = "") const;

private:
    struct Node {
        std::string key;
        std::vector<size_t> deps;
        std::vector<size_t> users;
    };

    const Node* find(const std::string& key) const;
    std::vector<std::string> keys_of(const std::vector<size_t>& ids) const;

    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace pinfold

#include "job_tree.hpp"
#include <algorithm>
#include <cctype>

namespace burncalc {

namespace {

using ChildrenByParent = std::map<std::optional<int64_t>, std::vector<const JobCode*>>;

std::vector<JobNode> make_children(
    const ChildrenByParent& children_by_parent,
    std::optional<int64_t> parent,
    std::set<int64_t>& visiting)
{
    std::vector<JobNode> nodes;
    auto it = children_by_parent.find(parent);
    if (it == children_by_parent.end()) {
        return nodes;
    }

    std::vector<const JobCode*> kids = it->second;
    std::stable_sort(kids.begin(), kids.end(), [](const JobCode* a, const JobCode* b) {
        return to_lower(a->name) < to_lower(b->name);
    });

    for (const JobCode* code : kids) {
        JobNode node(code->id, code->name);
        if (visiting.insert(code->id).second) {
            node.children = make_children(children_by_parent, code->id, visiting);
            visiting.erase(code->id);
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

std::string trim(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<JobNode> build_job_tree(const std::map<int64_t, JobCode>& codes) {
    ChildrenByParent children_by_parent;
    for (const auto& [id, code] : codes) {
        children_by_parent[code.parent_id].push_back(&code);
    }

    std::set<int64_t> visiting;
    std::vector<JobNode> roots = make_children(children_by_parent, std::nullopt, visiting);
    std::vector<JobNode> zero_parent = make_children(children_by_parent, int64_t{0}, visiting);
    roots.insert(roots.end(), std::make_move_iterator(zero_parent.begin()),
                 std::make_move_iterator(zero_parent.end()));
    return roots;
}

const JobNode* find_job(const std::vector<JobNode>& forest, int64_t id) {
    for (const auto& node : forest) {
        if (node.id == id) {
            return &node;
        }
        if (const JobNode* found = find_job(node.children, id)) {
            return found;
        }
    }
    return nullptr;
}

std::optional<std::string> display_name(const User& user) {
    if (user.display_name && !user.display_name->empty()) {
        return *user.display_name;
    }
    std::string full = trim(user.first_name.value_or("") + " " + user.last_name.value_or(""));
    if (full.empty()) {
        return std::nullopt;
    }
    return full;
}

std::vector<std::string> employee_names(
    const std::set<int64_t>& user_ids,
    const std::map<int64_t, User>& users)
{
    std::vector<std::string> names;
    for (int64_t uid : user_ids) {
        auto it = users.find(uid);
        if (it == users.end()) {
            continue;
        }
        if (auto name = display_name(it->second)) {
            names.push_back(*name);
        }
    }

    std::stable_sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return to_lower(a) < to_lower(b);
    });
    return names;
}

} // namespace burncalc

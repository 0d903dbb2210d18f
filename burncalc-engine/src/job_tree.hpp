#ifndef BURNCALC_JOB_TREE_HPP
#define BURNCALC_JOB_TREE_HPP

#include "timesheet_source.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace burncalc {

struct JobNode {
    int64_t id;
    std::string name;
    std::vector<JobNode> children;

    JobNode() : id(0) {}
    JobNode(int64_t id_, const std::string& name_) : id(id_), name(name_) {}
};

// Builds the job forest from parent links.
// Siblings are ordered by lowercase name. Roots are codes with no parent
// followed by codes whose parent is 0. A code whose ancestry loops back on
// itself is not expanded twice.
std::vector<JobNode> build_job_tree(const std::map<int64_t, JobCode>& codes);

// Depth-first search for a node by id
const JobNode* find_job(const std::vector<JobNode>& forest, int64_t id);

// Display name of a user: the account name if non-empty, otherwise
// "first last" trimmed; nullopt when neither yields text
std::optional<std::string> display_name(const User& user);

// Names of the given users that are known and nameable, sorted
// case-insensitively
std::vector<std::string> employee_names(
    const std::set<int64_t>& user_ids,
    const std::map<int64_t, User>& users
);

std::string to_lower(const std::string& text);

} // namespace burncalc

#endif // BURNCALC_JOB_TREE_HPP

#include "crossword_csp/model.hpp"
#include <stdexcept>

namespace crossword_csp {

Model::Model(PuzzlePtr puzzle, WordList words)
    : puzzle_(std::move(puzzle))
    , words_(std::move(words)) {
    if (!puzzle_) {
        throw std::invalid_argument("Model requires a puzzle");
    }
    size_t n = puzzle_->variables().size();
    domains_.assign(n, Domain::full(words_.size()));
    assigned_.assign(n, UNASSIGNED);
    last_saved_level_.assign(n, -1);
}

void Model::save_var_state(int save_point, size_t var_idx) {
    // 同じレベルで既に保存済みならスキップ
    if (last_saved_level_[var_idx] == save_point) {
        return;
    }
    last_saved_level_[var_idx] = save_point;

    VarTrailEntry entry;
    entry.var_idx = var_idx;
    entry.old_n = domains_[var_idx].size();
    entry.old_assigned = assigned_[var_idx];
    var_trail_.push_back({save_point, entry});
}

bool Model::remove_value(int save_point, size_t var_idx, WordId value) {
    auto& domain = domains_[var_idx];
    if (!domain.contains(value)) {
        return false;
    }
    save_var_state(save_point, var_idx);
    domain.remove(value);
    return true;
}

bool Model::instantiate(int save_point, size_t var_idx, WordId value) {
    auto& domain = domains_[var_idx];
    if (!domain.contains(value)) {
        return false;
    }
    save_var_state(save_point, var_idx);
    domain.assign(value);
    if (assigned_[var_idx] == UNASSIGNED) {
        assigned_count_++;
    }
    assigned_[var_idx] = value;
    return true;
}

void Model::rewind_to(int save_point) {
    while (!var_trail_.empty() && var_trail_.back().first > save_point) {
        const auto& entry = var_trail_.back().second;
        size_t var_idx = entry.var_idx;

        // 割り当てカウンタ調整
        bool was_assigned = assigned_[var_idx] != UNASSIGNED;
        bool will_be_assigned = entry.old_assigned != UNASSIGNED;
        if (was_assigned && !will_be_assigned) {
            assigned_count_--;
        } else if (!was_assigned && will_be_assigned) {
            assigned_count_++;
        }

        domains_[var_idx].set_n(entry.old_n);
        assigned_[var_idx] = entry.old_assigned;

        // 保存レベルをリセット
        last_saved_level_[var_idx] = -1;

        var_trail_.pop_back();
    }
}

} // namespace crossword_csp

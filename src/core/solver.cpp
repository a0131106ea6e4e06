#include "crossword_csp/solver.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <unordered_set>

namespace crossword_csp {

namespace {
// 範囲外なら '\0'
inline char letter_at(const std::string& word, size_t pos) {
    return pos < word.size() ? word[pos] : '\0';
}

const char* result_name(SearchResult result) {
    switch (result) {
    case SearchResult::SAT:
        return "SAT";
    case SearchResult::UNSAT:
        return "UNSAT";
    case SearchResult::UNKNOWN:
        break;
    }
    return "UNKNOWN";
}
}  // namespace

std::optional<Assignment> Solver::solve(Model& model) {
    // 初期化
    model.reset();
    stats_ = SolverStats{};
    current_decision_ = 1;

    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << model.num_variables()
                  << " variables, " << model.words().size() << " words\n";
    }

    // presolve: ノード整合 + アーク整合
    if (!enforce_node_consistency(model, current_decision_)) {
        if (verbose_) std::cerr << "% [verbose] node consistency emptied a domain\n";
        model.reset();
        last_result_ = SearchResult::UNSAT;
        return std::nullopt;
    }
    if (arc_consistency_ && !ac3(model, current_decision_)) {
        if (verbose_) std::cerr << "% [verbose] ac3 emptied a domain\n";
        model.reset();
        last_result_ = SearchResult::UNSAT;
        return std::nullopt;
    }
    if (verbose_) {
        std::cerr << "% [verbose] presolve done: pruned=" << stats_.pruned_count << "\n";
    }

    last_result_ = backtrack(model, 0);

    if (verbose_) {
        std::cerr << "% [verbose] search done: " << result_name(last_result_)
                  << " nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count << "\n";
    }

    if (last_result_ != SearchResult::SAT) {
        // 失敗時は呼び出し元に途中状態を見せない
        model.reset();
        return std::nullopt;
    }
    return build_assignment(model);
}

bool Solver::enforce_node_consistency(Model& model, int save_point) {
    const auto& puzzle = model.puzzle();
    for (size_t v = 0; v < model.num_variables(); ++v) {
        size_t length = puzzle.variable(v).length;

        std::vector<WordId> to_remove;
        for (auto w : model.domain(v)) {
            if (model.word(w).size() != length) {
                to_remove.push_back(w);
            }
        }
        for (auto w : to_remove) {
            model.remove_value(save_point, v, w);
        }
        stats_.pruned_count += to_remove.size();

        if (model.domain(v).empty()) {
            return false;
        }
    }
    return true;
}

bool Solver::revise(Model& model, size_t x, size_t y, int save_point) {
    stats_.revise_count++;
    const auto& overlap = model.puzzle().overlap(x, y);
    if (!overlap) {
        return false;
    }

    // y の定義域で j 文字目に現れる文字
    std::array<bool, 256> supported{};
    for (auto w : model.domain(y)) {
        const auto& word = model.word(w);
        if (overlap->second < word.size()) {
            supported[static_cast<unsigned char>(word[overlap->second])] = true;
        }
    }

    std::vector<WordId> to_remove;
    for (auto w : model.domain(x)) {
        const auto& word = model.word(w);
        if (overlap->first >= word.size() ||
            !supported[static_cast<unsigned char>(word[overlap->first])]) {
            to_remove.push_back(w);
        }
    }
    for (auto w : to_remove) {
        model.remove_value(save_point, x, w);
    }
    stats_.pruned_count += to_remove.size();
    return !to_remove.empty();
}

bool Solver::ac3(Model& model, int save_point) {
    const auto& puzzle = model.puzzle();
    std::deque<Arc> arcs;
    for (size_t x = 0; x < model.num_variables(); ++x) {
        for (size_t y : puzzle.neighbors(x)) {
            arcs.emplace_back(x, y);
        }
    }
    return ac3(model, std::move(arcs), save_point);
}

bool Solver::ac3(Model& model, std::deque<Arc> arcs, int save_point) {
    const auto& puzzle = model.puzzle();
    while (!arcs.empty()) {
        auto [x, y] = arcs.front();
        arcs.pop_front();

        if (revise(model, x, y, save_point)) {
            if (model.domain(x).empty()) {
                return false;
            }
            for (size_t k : puzzle.neighbors(x)) {
                if (k != y) {
                    arcs.emplace_back(k, x);
                }
            }
        }
    }
    return true;
}

bool Solver::is_complete(const Model& model) const {
    return model.assigned_count() == model.num_variables();
}

bool Solver::is_consistent(const Model& model) const {
    const auto& puzzle = model.puzzle();
    std::unordered_set<WordId> used;

    // 長さと重複
    for (size_t v = 0; v < model.num_variables(); ++v) {
        if (!model.is_assigned(v)) continue;
        WordId w = model.assigned_word(v);
        if (model.word(w).size() != puzzle.variable(v).length) {
            return false;
        }
        if (!used.insert(w).second) {
            return false;
        }
    }

    // 重なり
    for (size_t v = 0; v < model.num_variables(); ++v) {
        if (!model.is_assigned(v)) continue;
        const auto& word = model.word(model.assigned_word(v));
        for (size_t k : puzzle.neighbors(v)) {
            if (k < v || !model.is_assigned(k)) continue;
            const auto& overlap = puzzle.overlap(v, k);
            const auto& other = model.word(model.assigned_word(k));
            if (word[overlap->first] != other[overlap->second]) {
                return false;
            }
        }
    }
    return true;
}

bool Solver::is_consistent_with(const Model& model, size_t var, WordId word) const {
    const auto& puzzle = model.puzzle();
    const auto& text = model.word(word);
    if (text.size() != puzzle.variable(var).length) {
        return false;
    }

    for (size_t v = 0; v < model.num_variables(); ++v) {
        if (v == var || !model.is_assigned(v)) continue;
        if (model.assigned_word(v) == word) {
            return false;
        }
        const auto& overlap = puzzle.overlap(var, v);
        if (overlap &&
            text[overlap->first] != letter_at(model.word(model.assigned_word(v)), overlap->second)) {
            return false;
        }
    }
    return true;
}

size_t Solver::select_unassigned_variable(const Model& model) const {
    const auto& puzzle = model.puzzle();
    size_t best_idx = SIZE_MAX;
    size_t min_domain_size = 0;
    size_t max_degree = 0;

    for (size_t i = 0; i < model.num_variables(); ++i) {
        if (model.is_assigned(i)) continue;
        size_t domain_size = model.var_size(i);
        size_t degree = puzzle.degree(i);

        // MRV 優先、同じなら次数が大きいもの
        bool better = best_idx == SIZE_MAX ||
                      domain_size < min_domain_size ||
                      (domain_size == min_domain_size && degree > max_degree);
        if (better) {
            best_idx = i;
            min_domain_size = domain_size;
            max_degree = degree;
        }
    }
    return best_idx;
}

std::vector<WordId> Solver::order_domain_values(const Model& model, size_t var) const {
    auto values = model.domain(var).values();
    if (!lcv_) {
        return values;
    }

    const auto& puzzle = model.puzzle();
    std::vector<std::pair<size_t, WordId>> scored;
    scored.reserve(values.size());

    for (auto w : values) {
        const auto& word = model.word(w);
        size_t ruled_out = 0;
        for (size_t k : puzzle.neighbors(var)) {
            if (model.is_assigned(k)) continue;
            const auto& overlap = puzzle.overlap(var, k);
            char c = letter_at(word, overlap->first);
            for (auto other : model.domain(k)) {
                if (letter_at(model.word(other), overlap->second) != c) {
                    ruled_out++;
                }
            }
        }
        scored.emplace_back(ruled_out, w);
    }

    // 除外数の昇順、同点は単語ID順
    std::sort(scored.begin(), scored.end());

    std::vector<WordId> result;
    result.reserve(scored.size());
    for (const auto& [count, w] : scored) {
        result.push_back(w);
    }
    return result;
}

SearchResult Solver::backtrack(Model& model, size_t depth) {
    // 停止要求・ノード上限チェック
    if (stopped_) {
        return SearchResult::UNKNOWN;
    }
    if (node_limit_ > 0 && stats_.node_count >= node_limit_) {
        if (verbose_) std::cerr << "% [verbose] node limit reached\n";
        return SearchResult::UNKNOWN;
    }

    // 統計更新
    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (is_complete(model)) {
        return is_consistent(model) ? SearchResult::SAT : SearchResult::UNSAT;
    }

    size_t var = select_unassigned_variable(model);
    int save_point = current_decision_;

    for (auto w : order_domain_values(model, var)) {
        if (!is_consistent_with(model, var, w)) {
            continue;
        }

        current_decision_++;
        if (!model.instantiate(current_decision_, var, w)) {
            current_decision_--;
            continue;
        }

        if (!maintain_arc_consistency_ || propagate_assignment(model, var, w)) {
            auto res = backtrack(model, depth + 1);
            if (res == SearchResult::SAT) {
                return res;
            }
            if (res == SearchResult::UNKNOWN) {
                current_decision_--;
                model.rewind_to(save_point);
                return res;
            }
        }

        current_decision_--;
        model.rewind_to(save_point);
    }

    stats_.fail_count++;
    return SearchResult::UNSAT;
}

bool Solver::propagate_assignment(Model& model, size_t var, WordId word) {
    const auto& puzzle = model.puzzle();
    std::deque<Arc> arcs;

    // 同じ単語は二度使えない
    for (size_t k = 0; k < model.num_variables(); ++k) {
        if (k == var || model.is_assigned(k)) continue;
        if (model.remove_value(current_decision_, k, word)) {
            stats_.pruned_count++;
            if (model.domain(k).empty()) {
                return false;
            }
            for (size_t m : puzzle.neighbors(k)) {
                arcs.emplace_back(m, k);
            }
        }
    }

    for (size_t k : puzzle.neighbors(var)) {
        arcs.emplace_back(k, var);
    }
    return ac3(model, std::move(arcs), current_decision_);
}

Assignment Solver::build_assignment(const Model& model) const {
    Assignment result;
    const auto& puzzle = model.puzzle();
    for (size_t v = 0; v < model.num_variables(); ++v) {
        if (model.is_assigned(v)) {
            result[puzzle.variable(v)] = model.word(model.assigned_word(v));
        }
    }
    return result;
}

} // namespace crossword_csp

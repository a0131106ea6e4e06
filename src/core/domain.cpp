#include "crossword_csp/domain.hpp"
#include <algorithm>
#include <cassert>
#include <cstdint>

namespace crossword_csp {

Domain::Domain(std::vector<value_type> values) {
    if (values.empty()) {
        return;
    }
    // 重複を除去してソート
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());

    values_ = std::move(values);
    n_ = values_.size();

    sparse_.assign(values_.back() + 1, SIZE_MAX);
    for (size_t i = 0; i < n_; ++i) {
        sparse_[values_[i]] = i;
    }
}

Domain Domain::full(size_t count) {
    std::vector<value_type> values(count);
    for (size_t i = 0; i < count; ++i) {
        values[i] = i;
    }
    return Domain(std::move(values));
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return false;  // 元々存在しない
    }
    swap_at(sparse_[value], n_ - 1);
    --n_;
    return true;
}

bool Domain::assign(value_type value) {
    if (!contains(value)) {
        return false;
    }
    swap_at(sparse_[value], 0);
    n_ = 1;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(begin(), end());
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::swap_at(size_t i, size_t j) {
    assert(i < values_.size() && "swap_at: index i out of bounds");
    assert(j < values_.size() && "swap_at: index j out of bounds");
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[vi] = j;
    sparse_[vj] = i;
}

} // namespace crossword_csp

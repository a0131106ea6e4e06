/**
 * @file domain.hpp
 * @brief 単語定義域クラス（Sparse Set ベース）
 */
#ifndef CROSSWORD_CSP_DOMAIN_HPP
#define CROSSWORD_CSP_DOMAIN_HPP

#include "crossword_csp/word_list.hpp"
#include <cstddef>
#include <vector>

namespace crossword_csp {

/**
 * @brief 変数の候補単語IDの集合
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * 削除は有効範囲の末尾とのスワップで行うため、
 * バックトラック時の復元は size (n_) のリセットのみで O(1)。
 * 復元後の集合は一致するが、Dense 配列内の並び順は保存されない。
 */
class Domain {
public:
    using value_type = WordId;

    /**
     * @brief 空の定義域を作成
     */
    Domain() = default;

    /**
     * @brief 値リストから定義域を作成
     * @param values 単語IDのリスト（重複は除去）
     */
    explicit Domain(std::vector<value_type> values);

    /**
     * @brief 0..count-1 の全単語IDを含む定義域を作成
     */
    static Domain full(size_t count);

    bool empty() const { return n_ == 0; }
    size_t size() const { return n_; }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const {
        return value < sparse_.size() && sparse_[value] < n_;
    }

    /**
     * @brief 値を削除
     * @return 値が削除されたら true（元々無ければ false）
     * @note 最後の値も削除する（空になったかは empty() で判定）
     */
    bool remove(value_type value);

    /**
     * @brief 指定値のみに絞る
     * @return 値が含まれていれば true
     */
    bool assign(value_type value);

    /**
     * @brief 全ての有効な値を ID 昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return n_ == 1; }

    // ===== Sparse Set 内部アクセス（Model からの操作用） =====

    /**
     * @brief Dense 配列の有効範囲の先頭ポインタ
     */
    const value_type* begin() const { return values_.data(); }

    /**
     * @brief Dense 配列の有効範囲の末尾ポインタ
     */
    const value_type* end() const { return values_.data() + n_; }

    /**
     * @brief 有効サイズを設定（バックトラック用）
     */
    void set_n(size_t n) { n_ = n; }

    /**
     * @brief Sparse Set 内でスワップ
     */
    void swap_at(size_t i, size_t j);

private:
    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[id] = Dense 配列内のインデックス
    size_t n_ = 0;                    // 有効な値の数
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_DOMAIN_HPP

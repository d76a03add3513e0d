#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Tag type for dictionary-encoded categorical columns.
struct Categorical {};

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Columns are built once (by a loader or a gather) and then only read.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Copy the rows named by `rows` (in that order) into a new column.
    [[nodiscard]] auto gather(std::span<const std::size_t> rows) const -> Column<T> {
        std::vector<T> out;
        out.reserve(rows.size());
        for (auto row : rows) {
            out.push_back(data_[row]);
        }
        return Column<T>{std::move(out)};
    }

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

/// Specialization for categorical columns (dictionary-encoded strings).
///
/// Classification columns of a trial balance (codes, names, statement type)
/// repeat a handful of values over many rows, so they are stored as int32
/// codes into an immutable dictionary. Gathered columns share the dictionary.
template <>
class Column<Categorical> {
   public:
    using value_type = std::string_view;
    using size_type = std::size_t;
    using code_type = std::int32_t;

    Column() : dict_(std::make_shared<const std::vector<std::string>>()) {}

    Column(std::vector<std::string> dict, std::vector<code_type> codes)
        : dict_(std::make_shared<const std::vector<std::string>>(std::move(dict))),
          codes_(std::move(codes)) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return codes_.size(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> value_type {
        return (*dict_)[static_cast<std::size_t>(codes_[idx])];
    }

    [[nodiscard]] auto code_at(size_type idx) const noexcept -> code_type { return codes_[idx]; }

    [[nodiscard]] auto dictionary() const noexcept -> const std::vector<std::string>& {
        return *dict_;
    }

    [[nodiscard]] auto gather(std::span<const std::size_t> rows) const -> Column<Categorical> {
        std::vector<code_type> codes;
        codes.reserve(rows.size());
        for (auto row : rows) {
            codes.push_back(codes_[row]);
        }
        return Column<Categorical>{dict_, std::move(codes)};
    }

   private:
    Column(std::shared_ptr<const std::vector<std::string>> dict, std::vector<code_type> codes)
        : dict_(std::move(dict)), codes_(std::move(codes)) {}

    std::shared_ptr<const std::vector<std::string>> dict_;
    std::vector<code_type> codes_;
};

}  // namespace tally

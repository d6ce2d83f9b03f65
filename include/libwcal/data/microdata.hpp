#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace wcal::data {

// Columnar microdata: one survey weight per record plus read-only numeric
// (NaN = missing) and categorical covariates. Row count is fixed by the
// weight vector; column insertion order is preserved for write-back.
class MicrodataTable {
public:
    MicrodataTable() = default;
    explicit MicrodataTable(std::vector<double> weights, std::string weight_column = "weight");

    std::size_t size() const { return weights_.size(); }
    const std::vector<double>& weights() const { return weights_; }
    const std::string& weight_column() const { return weight_column_; }

    void add_numeric(const std::string& name, std::vector<double> values);
    void add_categorical(const std::string& name, std::vector<std::string> values);

    bool has_numeric(const std::string& name) const;
    bool has_categorical(const std::string& name) const;

    // Throw std::out_of_range for unknown columns.
    const std::vector<double>& numeric(const std::string& name) const;
    const std::vector<std::string>& categorical(const std::string& name) const;

    // Weight column included, in insertion order.
    const std::vector<std::string>& column_order() const { return order_; }

    // Moves the weight column to position index of column_order(), clamped
    // to the last position.
    void place_weight_column(std::size_t index);

    // Copy of the table carrying a different weight vector of the same length.
    MicrodataTable with_weights(std::vector<double> weights) const;

private:
    std::vector<double> weights_;
    std::string weight_column_ = "weight";
    std::unordered_map<std::string, std::vector<double>> numeric_;
    std::unordered_map<std::string, std::vector<std::string>> categorical_;
    std::vector<std::string> order_;

    void check_new_column(const std::string& name, std::size_t length) const;
};

} // namespace wcal::data

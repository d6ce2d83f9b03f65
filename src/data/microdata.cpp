#include "libwcal/data/microdata.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace wcal::data {

MicrodataTable::MicrodataTable(std::vector<double> weights, std::string weight_column)
    : weights_(std::move(weights)), weight_column_(std::move(weight_column)) {
    order_.push_back(weight_column_);
}

void MicrodataTable::check_new_column(const std::string& name, std::size_t length) const {
    if (name == weight_column_ || numeric_.count(name) || categorical_.count(name)) {
        throw std::invalid_argument("MicrodataTable: duplicate column '" + name + "'");
    }
    if (length != weights_.size()) {
        throw std::invalid_argument("MicrodataTable: column '" + name + "' has " +
                                    std::to_string(length) + " values, expected " +
                                    std::to_string(weights_.size()));
    }
}

void MicrodataTable::add_numeric(const std::string& name, std::vector<double> values) {
    check_new_column(name, values.size());
    numeric_.emplace(name, std::move(values));
    order_.push_back(name);
}

void MicrodataTable::add_categorical(const std::string& name, std::vector<std::string> values) {
    check_new_column(name, values.size());
    categorical_.emplace(name, std::move(values));
    order_.push_back(name);
}

void MicrodataTable::place_weight_column(std::size_t index) {
    const auto it = std::find(order_.begin(), order_.end(), weight_column_);
    if (it == order_.end()) {
        return;
    }
    order_.erase(it);
    index = std::min(index, order_.size());
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(index), weight_column_);
}

bool MicrodataTable::has_numeric(const std::string& name) const {
    return numeric_.count(name) > 0;
}

bool MicrodataTable::has_categorical(const std::string& name) const {
    return categorical_.count(name) > 0;
}

const std::vector<double>& MicrodataTable::numeric(const std::string& name) const {
    const auto it = numeric_.find(name);
    if (it == numeric_.end()) {
        throw std::out_of_range("MicrodataTable: no numeric column '" + name + "'");
    }
    return it->second;
}

const std::vector<std::string>& MicrodataTable::categorical(const std::string& name) const {
    const auto it = categorical_.find(name);
    if (it == categorical_.end()) {
        throw std::out_of_range("MicrodataTable: no categorical column '" + name + "'");
    }
    return it->second;
}

MicrodataTable MicrodataTable::with_weights(std::vector<double> weights) const {
    if (weights.size() != weights_.size()) {
        throw std::invalid_argument("MicrodataTable::with_weights: expected " +
                                    std::to_string(weights_.size()) + " weights, got " +
                                    std::to_string(weights.size()));
    }
    MicrodataTable copy = *this;
    copy.weights_ = std::move(weights);
    return copy;
}

} // namespace wcal::data

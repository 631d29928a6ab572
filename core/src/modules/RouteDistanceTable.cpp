#include "modules/RouteDistanceTable.h"

#include <utility>

RouteDistanceTable::RouteDistanceTable(std::map<Key, double> entries, double fallback)
    : entries_(std::move(entries)), fallback_(fallback) {}

RouteDistanceTable RouteDistanceTable::nusantara() {
    std::map<Key, double> entries = {
        {{"malacca", "jakarta"}, 0.8},     {{"jakarta", "malacca"}, 0.8},
        {{"malacca", "palembang"}, 0.9},   {{"palembang", "malacca"}, 0.9},
        {{"jakarta", "surabaya"}, 0.9},    {{"surabaya", "jakarta"}, 0.9},
        {{"surabaya", "makassar"}, 0.7},   {{"makassar", "surabaya"}, 0.7},
        {{"makassar", "ternate"}, 0.6},    {{"ternate", "makassar"}, 0.6},
        {{"brunei", "manila"}, 0.7},       {{"manila", "brunei"}, 0.7},
        {{"manila", "cebu"}, 0.9},         {{"cebu", "manila"}, 0.9},
        {{"jakarta", "banjarmasin"}, 0.8}, {{"banjarmasin", "jakarta"}, 0.8}
    };
    return RouteDistanceTable(std::move(entries));
}

double RouteDistanceTable::distance(const std::string& from, const std::string& to) const {
    auto it = entries_.find(Key(from, to));
    return it != entries_.end() ? it->second : fallback_;
}

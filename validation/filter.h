/**
 * @file qbm/gate/validation/filter.h
 * @brief Composable predicates checking the shape of a `qb::json` value.
 *
 * A filter evaluates a JSON value and returns a `Verdict`: accepted, or rejected with a
 * single reason naming where the value went wrong (`"items: 2: expected int, found "x" of type string"`).
 * Leaves check a JSON kind (and, for numbers, an inclusive range); `ArrayFilter`,
 * `ObjectFilter` and `OptionsFilter` combine other filters.
 *
 * @code
 * using namespace qb::gate::validation;
 * auto item = filter::object({filter::required("id", filter::integer(0)),
 *                             filter::optional("description", filter::string())});
 * Verdict v = item->evaluate(qb::json::parse(R"({"id": 5})"));
 * @endcode
 *
 * Filters are immutable once built, hold no per-call state and can be shared between threads.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <qb/json.h>

namespace qb::gate::validation {

/**
 * @brief Outcome of a filter evaluation. `reason` is empty iff `accepted`.
 */
struct Verdict {
    bool accepted = true;
    std::string reason;

    static Verdict accept() { return {}; }
    static Verdict reject(std::string why) { return {false, std::move(why)}; }

    explicit operator bool() const noexcept { return accepted; }
};

/** @brief Identifies the variant of a filter, for introspection. */
enum class FilterKind {
    NUMBER,
    INT,
    FLOAT,
    STRING,
    BOOLEAN,
    NUL,
    ARRAY,
    OBJECT,
    OPTIONS
};

/** @brief Name used in rejection reasons ("number", "int", "float", "string", ...). */
std::string to_string(FilterKind kind);

/**
 * @brief Interface of a JSON-shape filter.
 */
class IFilter {
public:
    virtual ~IFilter() = default;

    /**
     * @brief Checks a value.
     * @return The verdict. Combinators stop at the first failing child.
     */
    virtual Verdict evaluate(const qb::json& value) const = 0;

    virtual FilterKind kind() const noexcept = 0;
};

using FilterPtr = std::shared_ptr<const IFilter>;

/** @brief Numbers, optionally restricted to integers or floats and to an inclusive range. */
class NumberFilter : public IFilter {
private:
    FilterKind _kind;
    std::optional<double> _min;
    std::optional<double> _max;
public:
    /**
     * @param kind `NUMBER`, `INT` or `FLOAT`.
     * @throws std::invalid_argument on another kind or when `min > max`.
     */
    NumberFilter(FilterKind kind, std::optional<double> min = std::nullopt, std::optional<double> max = std::nullopt);
    Verdict evaluate(const qb::json& value) const override;
    FilterKind kind() const noexcept override { return _kind; }
    const std::optional<double>& min() const noexcept { return _min; }
    const std::optional<double>& max() const noexcept { return _max; }
};

/** @brief Exact-kind check for strings, booleans and null. */
class TypeFilter : public IFilter {
private:
    FilterKind _kind;
public:
    /** @throws std::invalid_argument unless `kind` is `STRING`, `BOOLEAN` or `NUL`. */
    explicit TypeFilter(FilterKind kind);
    Verdict evaluate(const qb::json& value) const override;
    FilterKind kind() const noexcept override { return _kind; }
};

/** @brief Arrays whose every element passes one child filter. */
class ArrayFilter : public IFilter {
private:
    FilterPtr _items;
public:
    /** @throws std::invalid_argument if `items` is null. */
    explicit ArrayFilter(FilterPtr items);
    Verdict evaluate(const qb::json& value) const override;
    FilterKind kind() const noexcept override { return FilterKind::ARRAY; }
    const FilterPtr& items() const noexcept { return _items; }
};

/** @brief What an `ObjectFilter` does with keys it does not declare. */
enum class ExtraKeys {
    Reject,
    Allow
};

/** @brief One declared key of an `ObjectFilter`. */
struct ObjectEntry {
    std::string key;
    FilterPtr filter;
    bool required = true;
};

/** @brief Objects with declared keys, checked in declaration order. */
class ObjectFilter : public IFilter {
private:
    std::vector<ObjectEntry> _entries;
    ExtraKeys _extra_keys;
public:
    /** @throws std::invalid_argument on a null entry filter or a key declared twice. */
    explicit ObjectFilter(std::vector<ObjectEntry> entries, ExtraKeys extra_keys = ExtraKeys::Reject);
    Verdict evaluate(const qb::json& value) const override;
    FilterKind kind() const noexcept override { return FilterKind::OBJECT; }
    const std::vector<ObjectEntry>& entries() const noexcept { return _entries; }
    ExtraKeys extra_keys() const noexcept { return _extra_keys; }
};

/** @brief Alternation: accepted by the first alternative that accepts. */
class OptionsFilter : public IFilter {
private:
    std::vector<FilterPtr> _alternatives;
public:
    /** @throws std::invalid_argument if the list is empty or holds a null filter. */
    explicit OptionsFilter(std::vector<FilterPtr> alternatives);
    Verdict evaluate(const qb::json& value) const override;
    FilterKind kind() const noexcept override { return FilterKind::OPTIONS; }
    const std::vector<FilterPtr>& alternatives() const noexcept { return _alternatives; }
};

/**
 * @brief Factories returning shared filters.
 */
namespace filter {
    FilterPtr number(std::optional<double> min = std::nullopt, std::optional<double> max = std::nullopt);
    FilterPtr integer(std::optional<double> min = std::nullopt, std::optional<double> max = std::nullopt);
    FilterPtr floating(std::optional<double> min = std::nullopt, std::optional<double> max = std::nullopt);
    FilterPtr string();
    FilterPtr boolean();
    FilterPtr null();
    FilterPtr array(FilterPtr items);
    FilterPtr object(std::vector<ObjectEntry> entries, ExtraKeys extra_keys = ExtraKeys::Reject);
    FilterPtr options(std::vector<FilterPtr> alternatives);

    /** @brief A key that must be present. */
    ObjectEntry required(std::string key, FilterPtr filter);
    /** @brief A key that may be absent; checked when present. */
    ObjectEntry optional(std::string key, FilterPtr filter);
} // namespace filter

} // namespace qb::gate::validation

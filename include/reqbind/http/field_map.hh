/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2026 The reqbind Authors
 */

#pragma once

#include <reqbind/core/sstring.hh>
#include <reqbind/http/binding_result.hh>
#include <reqbind/http/bound_value.hh>
#include <reqbind/http/parameter_converter.hh>
#include <reqbind/http/parameter_exception.hh>
#include <reqbind/http/parameter_metadata.hh>

#include <cmath>
#include <concepts>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace reqbind::httpd {

/// How a converted value is stored into a destination member of type M,
/// and which descriptor a member of type M gets when an object parameter
/// does not declare its properties.
template <typename M>
struct value_traits;

namespace internal {

inline bool cannot_hold(std::string_view member_type, const bound_value& v, const binding_scope& s) {
    s.fail(binding_error_kind::CONFIGURATION_ERROR,
           fmt::format("destination field of type '{}' cannot hold a value of type '{}'", member_type, v.kind_name()));
    return false;
}

inline parameter_descriptor derived_descriptor(sstring name, parameter_type type, parameter_format format = parameter_format::NONE) {
    return parameter_descriptor(std::move(name), parameter_location::BODY, type).with_format(format);
}

template <typename M>
struct exact_value_traits {
    static bool assign(M& m, bound_value&& v, const binding_scope& s) {
        if (auto p = v.get_if<M>()) {
            m = std::move(*p);
            return true;
        }
        return cannot_hold(value_traits<M>::name, v, s);
    }
};

}

template <IntegralParameter M>
struct value_traits<M> {
    static constexpr std::string_view name = type_name<M>();

    static bool assign(M& m, bound_value&& v, const binding_scope& s) {
        auto store = [&] (auto i) {
            if (!std::in_range<M>(i)) {
                s.fail(binding_error_kind::MALFORMED_VALUE,
                       format_validation_message(s.name(), fmt::to_string(i), fmt::format("Value out of range for type '{}'", name)));
                return false;
            }
            m = static_cast<M>(i);
            return true;
        };
        if (auto p = v.get_if<int32_t>()) {
            return store(*p);
        }
        if (auto p = v.get_if<int64_t>()) {
            return store(*p);
        }
        return internal::cannot_hold(name, v, s);
    }

    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::INTEGER, parameter_converter<M>::format_enum());
    }
};

template <FloatingPointParameter M>
struct value_traits<M> {
    static constexpr std::string_view name = type_name<M>();

    static bool assign(M& m, bound_value&& v, const binding_scope& s) {
        if (auto p = v.get_if<float>()) {
            m = *p;
        } else if (auto p = v.get_if<double>()) {
            if constexpr (sizeof(M) < sizeof(double)) {
                // the conversion is undefined for finite values M cannot represent
                if (std::isfinite(*p) && std::abs(*p) > static_cast<double>(std::numeric_limits<M>::max())) {
                    s.fail(binding_error_kind::MALFORMED_VALUE,
                           format_validation_message(s.name(), fmt::to_string(*p), fmt::format("Value out of range for type '{}'", name)));
                    return false;
                }
            }
            m = static_cast<M>(*p);
        } else if (auto p = v.get_if<int32_t>()) {
            m = static_cast<M>(*p);
        } else if (auto p = v.get_if<int64_t>()) {
            m = static_cast<M>(*p);
        } else {
            return internal::cannot_hold(name, v, s);
        }
        return true;
    }

    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::NUMBER, parameter_converter<M>::format_enum());
    }
};

template <>
struct value_traits<bool> : internal::exact_value_traits<bool> {
    static constexpr std::string_view name = "boolean";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::BOOLEAN);
    }
};

template <>
struct value_traits<sstring> : internal::exact_value_traits<sstring> {
    static constexpr std::string_view name = "string";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::STRING);
    }
};

template <>
struct value_traits<date> : internal::exact_value_traits<date> {
    static constexpr std::string_view name = "date";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::STRING, parameter_format::DATE);
    }
};

template <>
struct value_traits<date_time> : internal::exact_value_traits<date_time> {
    static constexpr std::string_view name = "date-time";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::STRING, parameter_format::DATE_TIME);
    }
};

template <>
struct value_traits<bytes> : internal::exact_value_traits<bytes> {
    static constexpr std::string_view name = "byte";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::STRING, parameter_format::BYTE);
    }
};

template <>
struct value_traits<file_upload> : internal::exact_value_traits<file_upload> {
    static constexpr std::string_view name = "file";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::FILE);
    }
};

/// Receives an object value as is
template <>
struct value_traits<generic_value> : internal::exact_value_traits<generic_value> {
    static constexpr std::string_view name = "object";
    static parameter_descriptor describe(sstring name) {
        return internal::derived_descriptor(std::move(name), parameter_type::OBJECT);
    }
};

template <typename T>
class field_map;

namespace internal {

template <typename M>
concept ListMember = !std::same_as<M, bytes>
    && requires { typename M::value_type; }
    && std::same_as<M, std::vector<typename M::value_type>>;

template <typename M>
concept OptionalMember = requires { typename M::value_type; }
    && std::same_as<M, std::optional<typename M::value_type>>;

template <typename M>
concept PointerMember = requires { typename M::element_type; }
    && std::same_as<M, std::unique_ptr<typename M::element_type>>;

// Setters store a converted value into a member. They are composed
// following the member type, e.g. std::vector<std::optional<int32_t>>.

template <typename M>
struct scalar_setter {
    bool operator()(M& m, bound_value&& v, const parameter_descriptor&, const binding_scope& s) const {
        return value_traits<M>::assign(m, std::move(v), s);
    }
    parameter_descriptor describe(sstring name) const {
        return value_traits<M>::describe(std::move(name));
    }
};

template <typename S>
struct object_setter {
    std::shared_ptr<const field_map<S>> fields;

    bool operator()(S& m, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const {
        return fields->bind_object(m, std::move(v), d, s);
    }
    parameter_descriptor describe(sstring name) const {
        return derived_descriptor(std::move(name), parameter_type::OBJECT);
    }
};

template <typename E, typename Setter>
struct list_setter {
    Setter element;

    bool operator()(std::vector<E>& m, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const {
        auto list = v.get_if<bound_list>();
        if (!list) {
            return cannot_hold("array", v, s);
        }
        std::optional<parameter_descriptor> derived;
        if (!d.items()) {
            derived = element.describe(d.name());
        }
        const parameter_descriptor& items = d.items() ? *d.items() : *derived;
        std::vector<E> out;
        out.reserve(list->size());
        bool ok = true;
        for (size_t i = 0; i < list->size(); ++i) {
            E e{};
            if (element(e, std::move((*list)[i]), items, s.element(i))) {
                out.push_back(std::move(e));
            } else {
                ok = false;
            }
        }
        if (ok) {
            m = std::move(out);
        }
        return ok;
    }
    parameter_descriptor describe(sstring name) const {
        auto items = element.describe(name);
        return derived_descriptor(std::move(name), parameter_type::ARRAY).with_items(std::move(items));
    }
};

template <typename E, typename Setter>
struct optional_setter {
    Setter inner;

    bool operator()(std::optional<E>& m, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const {
        E e{};
        if (!inner(e, std::move(v), d, s)) {
            return false;
        }
        m = std::move(e);
        return true;
    }
    parameter_descriptor describe(sstring name) const {
        return inner.describe(std::move(name));
    }
};

template <typename E, typename Setter>
struct pointer_setter {
    Setter inner;

    bool operator()(std::unique_ptr<E>& m, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const {
        auto e = std::make_unique<E>();
        if (!inner(*e, std::move(v), d, s)) {
            return false;
        }
        m = std::move(e);
        return true;
    }
    parameter_descriptor describe(sstring name) const {
        return inner.describe(std::move(name));
    }
};

template <typename M>
auto make_setter() {
    if constexpr (ListMember<M>) {
        using E = typename M::value_type;
        return list_setter<E, decltype(make_setter<E>())>{make_setter<E>()};
    } else if constexpr (OptionalMember<M>) {
        using E = typename M::value_type;
        return optional_setter<E, decltype(make_setter<E>())>{make_setter<E>()};
    } else if constexpr (PointerMember<M>) {
        using E = typename M::element_type;
        return pointer_setter<E, decltype(make_setter<E>())>{make_setter<E>()};
    } else {
        return scalar_setter<M>{};
    }
}

template <typename M, typename S>
auto make_nested_setter(std::shared_ptr<const field_map<S>> fields) {
    if constexpr (std::same_as<M, S>) {
        return object_setter<S>{std::move(fields)};
    } else if constexpr (ListMember<M>) {
        using E = typename M::value_type;
        using inner_type = decltype(make_nested_setter<E, S>(fields));
        return list_setter<E, inner_type>{make_nested_setter<E, S>(std::move(fields))};
    } else if constexpr (OptionalMember<M>) {
        using E = typename M::value_type;
        using inner_type = decltype(make_nested_setter<E, S>(fields));
        return optional_setter<E, inner_type>{make_nested_setter<E, S>(std::move(fields))};
    } else {
        static_assert(PointerMember<M>, "member must be S, or a vector, optional or unique_ptr of it");
        using E = typename M::element_type;
        using inner_type = decltype(make_nested_setter<E, S>(fields));
        return pointer_setter<E, inner_type>{make_nested_setter<E, S>(std::move(fields))};
    }
}

}

/**
 * Statically typed table of the destination fields of T.
 *
 * Each entry maps a field identifier to a member of T. The way a value is
 * stored follows the member type; members holding a nested structure are
 * added together with the field_map of that structure.
 *
 * \code {.cpp}
 * auto friend_fields = field_map<pet_friend>()
 *         .add("name", &pet_friend::name)
 *         .add("age", &pet_friend::age);
 * auto fields = field_map<pet_params>()
 *         .add("id", &pet_params::id)
 *         .add("friends", &pet_params::friends, friend_fields);
 * \endcode
 */
template <typename T>
class field_map {
public:
    using setter_type = std::function<bool(T&, bound_value&&, const parameter_descriptor&, const binding_scope&)>;
    using describe_type = std::function<parameter_descriptor(sstring)>;

    struct slot {
        sstring field;
        setter_type assign;
        describe_type describe;
    };
private:
    std::vector<slot> _slots;

    template <typename M, typename Setter>
    void add_slot(sstring field, M T::* member, Setter setter) {
        if (find(field)) {
            throw binding_configuration_exception(fmt::format("field '{}' is mapped twice", field));
        }
        auto assign = [member, setter] (T& dest, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) {
            return setter(dest.*member, std::move(v), d, s);
        };
        auto describe = [setter] (sstring name) {
            return setter.describe(std::move(name));
        };
        _slots.push_back(slot{std::move(field), std::move(assign), std::move(describe)});
    }
public:
    /// Map \c field to \c member
    /// Throws binding_configuration_exception if \c field is already mapped
    template <typename M>
    field_map& add(sstring field, M T::* member) {
        add_slot(std::move(field), member, internal::make_setter<M>());
        return *this;
    }

    /// Map \c field to a member holding S (directly, or in a vector,
    /// optional or unique_ptr), whose own fields are given by \c nested
    template <typename M, typename S>
    field_map& add(sstring field, M T::* member, field_map<S> nested) {
        auto fields = std::make_shared<const field_map<S>>(std::move(nested));
        add_slot(std::move(field), member, internal::make_nested_setter<M, S>(std::move(fields)));
        return *this;
    }

    const slot* find(std::string_view field) const noexcept {
        for (auto&& s : _slots) {
            if (s.field == field) {
                return &s;
            }
        }
        return nullptr;
    }

    bool has_field(std::string_view field) const noexcept {
        return find(field) != nullptr;
    }

    const std::vector<slot>& slots() const noexcept {
        return _slots;
    }

    /**
     * Store the members of a decoded object into \c dest.
     *
     * The members are the properties of \c d when it declares some, and
     * otherwise one per mapped field, named after the field. Every member
     * is handled even after a failure; errors are named after \c s.
     *
     * @return true if no error was recorded
     */
    bool bind_object(T& dest, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const;
};

template <typename T>
bool field_map<T>::bind_object(T& dest, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) const {
    auto obj = v.get_if<generic_value>();
    if (!obj) {
        return internal::cannot_hold("object", v, s);
    }
    if (obj->type() != generic_value::kind::object) {
        s.fail(binding_error_kind::MALFORMED_VALUE,
               format_validation_message(s.name(), "", fmt::format("expected object, got {}", to_string(obj->type()))));
        return false;
    }

    bool ok = true;
    auto bind_member = [&] (const sstring& field, const parameter_descriptor& member) {
        auto ms = s.member(member.name());
        auto sl = find(field);
        if (!sl) {
            ms.fail(binding_error_kind::CONFIGURATION_ERROR, fmt::format("no destination field '{}'", field));
            ok = false;
            return;
        }
        auto raw = obj->find(member.name());
        if (!raw || raw->is_null()) {
            if (member.default_value()) {
                raw = &*member.default_value();
            } else {
                if (member.required()) {
                    ms.fail(binding_error_kind::MISSING_REQUIRED,
                            format_validation_message(ms.name(), "", "Value is required"));
                    ok = false;
                }
                return;
            }
        }
        sstring reason;
        auto value = coerce_generic(member, *raw, reason);
        if (!value) {
            ms.fail(binding_error_kind::MALFORMED_VALUE, format_validation_message(ms.name(), "", reason));
            ok = false;
            return;
        }
        if (!sl->assign(dest, std::move(*value), member, ms)) {
            ok = false;
        }
    };

    if (!d.properties().empty()) {
        for (auto&& [field, member] : d.properties()) {
            bind_member(field, member);
        }
    } else {
        for (auto&& sl : _slots) {
            bind_member(sl.field, sl.describe(sl.field));
        }
    }
    return ok;
}

/// A destination as seen by the binder: fields addressed by identifier
class binding_target {
public:
    virtual ~binding_target() = default;
    virtual bool has_field(std::string_view field) const = 0;
    virtual bool assign(std::string_view field, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) = 0;
};

template <typename T>
class field_target final : public binding_target {
    const field_map<T>& _fields;
    T& _dest;
public:
    field_target(const field_map<T>& fields, T& dest) noexcept
        : _fields(fields), _dest(dest) {}

    bool has_field(std::string_view field) const override {
        return _fields.has_field(field);
    }

    bool assign(std::string_view field, bound_value&& v, const parameter_descriptor& d, const binding_scope& s) override {
        auto sl = _fields.find(field);
        if (!sl) {
            s.fail(binding_error_kind::CONFIGURATION_ERROR, fmt::format("no destination field '{}'", field));
            return false;
        }
        return sl->assign(_dest, std::move(v), d, s);
    }
};

}

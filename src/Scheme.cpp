/**
 * @file Scheme.cpp
 * @brief Implementation of lightweight scheme checking
 */

#include "vetter/Scheme.hpp"
#include "vetter/Errors.hpp"
#include <stdexcept>

namespace vetter {

namespace {

std::string join_context(const std::string& context, const std::string& step) {
    return context.empty() ? step : context + "." + step;
}

} // anonymous namespace

Scheme Scheme::check(CheckFunc check) {
    if (!check) {
        throw std::invalid_argument("Scheme::check() requires a check function");
    }
    Scheme scheme(Kind::Check);
    scheme.check_ = std::move(check);
    return scheme;
}

Scheme Scheme::object(std::vector<Field> fields) {
    Scheme scheme(Kind::Object);
    scheme.fields_ = std::make_shared<const std::vector<Field>>(std::move(fields));
    return scheme;
}

Scheme Scheme::array(Scheme element) {
    Scheme scheme(Kind::Array);
    scheme.element_ = std::make_shared<const Scheme>(std::move(element));
    return scheme;
}

Value validate(const Value& value, const Scheme& scheme, const std::string& context) {
    switch (scheme.kind()) {
        case Scheme::Kind::Array: {
            if (!value.is_array()) {
                throw SchemeError("expected array", context);
            }
            for (std::size_t i = 0; i < value.size(); ++i) {
                validate(value[i], scheme.element(),
                         join_context(context, "#" + std::to_string(i)));
            }
            break;
        }

        case Scheme::Kind::Check: {
            const std::string message = scheme.check_func()(value, context);
            if (!message.empty()) {
                throw SchemeError(message, context);
            }
            break;
        }

        case Scheme::Kind::Object: {
            if (!value.is_object()) {
                throw SchemeError("expected object", context);
            }
            for (const auto& [key, field] : scheme.fields()) {
                auto it = value.find(key);
                validate(it != value.end() ? *it : undefined(), field,
                         join_context(context, key));
            }
            break;
        }
    }
    return value;
}

Scheme optional(Scheme scheme) {
    return Scheme::check([scheme = std::move(scheme)](const Value& value,
                                                      const std::string& context) {
        if (!is_undefined(value)) {
            validate(value, scheme, context);
        }
        return std::string();
    });
}

Scheme nullable(Scheme scheme) {
    return Scheme::check([scheme = std::move(scheme)](const Value& value,
                                                      const std::string& context) {
        if (!value.is_null()) {
            validate(value, scheme, context);
        }
        return std::string();
    });
}

} // namespace vetter

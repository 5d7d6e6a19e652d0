#pragma once
// MotObject.hpp – A fully assembled MOT object.
//
// The object owns its body and at most one parameter per ParameterKey.
// ContentName is mandatory and always present; it is stored alongside the
// other parameters and exposed through name().

#include "ContentType.hpp"
#include "Parameter.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mot {

class MotObject {
public:
    MotObject(ContentName name, std::vector<uint8_t> body,
              ContentType content_type, uint16_t transport_id);

    [[nodiscard]] const ContentName&          name()        const;
    [[nodiscard]] const std::vector<uint8_t>& body()        const noexcept { return body_; }
    [[nodiscard]] ContentType                 contentType() const noexcept { return content_type_; }
    [[nodiscard]] uint16_t                    transportId() const noexcept { return transport_id_; }

    void setBody(std::vector<uint8_t> body) { body_ = std::move(body); }

    // Attach a header parameter, replacing any parameter of the same kind.
    // Directory-scope parameters are rejected with ValidationError.
    void addParameter(Parameter p);

    // ContentName cannot be removed (ValidationError). Returns whether a
    // parameter was removed.
    bool removeParameter(ParameterKey key);

    [[nodiscard]] bool hasParameter(ParameterKey key) const { return params_.count(key) != 0; }
    [[nodiscard]] bool hasParameter(ParameterKind kind) const { return hasParameter(ParameterKey{kind, 0}); }

    // nullptr if absent.
    [[nodiscard]] const Parameter* parameter(ParameterKey key) const;

    // Typed access to a core parameter, e.g. object.get<MimeType>().
    template <typename T>
    [[nodiscard]] const T* get() const {
        for (const auto& [key, p] : params_) {
            if (const T* v = std::get_if<T>(&p)) return v;
        }
        return nullptr;
    }

    // ContentName first, then the remaining parameters in kind order.
    [[nodiscard]] std::vector<Parameter> parameters() const;

    // `"name" [transport id]`
    [[nodiscard]] std::string toString() const;

private:
    std::vector<uint8_t>              body_;
    ContentType                       content_type_;
    uint16_t                          transport_id_;
    std::map<ParameterKey, Parameter> params_;
};

} // namespace mot

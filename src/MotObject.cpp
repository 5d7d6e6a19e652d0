// MotObject.cpp – Parameter bookkeeping for assembled objects.

#include "MOTCodec/MotObject.hpp"
#include "MOTCodec/Errors.hpp"

#include <fmt/format.h>

namespace mot {

namespace {
constexpr ParameterKey kNameKey{ParameterKind::ContentName, 0};
}

MotObject::MotObject(ContentName name, std::vector<uint8_t> body,
                     ContentType content_type, uint16_t transport_id)
    : body_(std::move(body)),
      content_type_(content_type),
      transport_id_(transport_id) {
    params_.emplace(kNameKey, std::move(name));
}

const ContentName& MotObject::name() const {
    return std::get<ContentName>(params_.at(kNameKey));
}

void MotObject::addParameter(Parameter p) {
    if (scopeOf(p) != ParameterScope::Header)
        throw ValidationError(std::string(kindName(kindOf(p))) +
                              " is a directory parameter and cannot be attached to an object");
    const ParameterKey key = keyOf(p);
    params_.insert_or_assign(key, std::move(p));
}

bool MotObject::removeParameter(ParameterKey key) {
    if (key == kNameKey)
        throw ValidationError("ContentName is mandatory and cannot be removed");
    return params_.erase(key) != 0;
}

const Parameter* MotObject::parameter(ParameterKey key) const {
    auto it = params_.find(key);
    return it == params_.end() ? nullptr : &it->second;
}

std::vector<Parameter> MotObject::parameters() const {
    // kNameKey sorts first in the map.
    std::vector<Parameter> out;
    out.reserve(params_.size());
    for (const auto& [key, p] : params_) out.push_back(p);
    return out;
}

std::string MotObject::toString() const {
    return fmt::format("\"{}\" [{}]", name().name, transport_id_);
}

} // namespace mot

#include "sweep/binding_target.hpp"

#include "sweep/errors.hpp"

namespace sweep {

std::string toString(BindingTarget target) {
    switch (target) {
        case BindingTarget::None:
            return "none";
        case BindingTarget::FastWindow:
            return "fast_window";
        case BindingTarget::SlowWindow:
            return "slow_window";
        case BindingTarget::AverageKind:
            return "average_kind";
    }
    return "none";
}

BindingTarget bindingTargetFromString(const std::string& name) {
    if (name == "none") {
        return BindingTarget::None;
    }
    if (name == "fast_window") {
        return BindingTarget::FastWindow;
    }
    if (name == "slow_window") {
        return BindingTarget::SlowWindow;
    }
    if (name == "average_kind") {
        return BindingTarget::AverageKind;
    }
    throw ConfigurationError("unknown binding target '" + name + "'");
}

}  // namespace sweep

#include "resource/ResourceCatalog.hpp"

#include <sstream>

namespace RS {

auto ResourceFallback::describe() const -> std::string {
    switch (this->type) {
    case Type::None:
        return "none";
    case Type::Drawable:
        return std::string{"drawable:"}.append(this->drawable);
    case Type::Color:
        return std::string{"color:"}.append(colorTokenToString(this->color));
    case Type::Dimension: {
        std::ostringstream oss;
        oss << "dimension:" << this->dp << "dp";
        return oss.str();
    }
    }
    return "none";
}

} // namespace RS

#include "obfuscator/core/document.hpp"

namespace obfuscator {

auto preserves_shape(const Document& original, const Document& derived) -> bool {
    auto derived_kind = kind_of(derived);
    if (derived_kind == NodeKind::Scalar) {
        return true;
    }
    if (kind_of(original) != derived_kind || original.size() != derived.size()) {
        return false;
    }

    if (derived_kind == NodeKind::Mapping) {
        auto it = original.begin();
        auto jt = derived.begin();
        for (; it != original.end(); ++it, ++jt) {
            if (it.key() != jt.key() || !preserves_shape(*it, *jt)) {
                return false;
            }
        }
        return true;
    }

    for (size_t i = 0; i < original.size(); ++i) {
        if (!preserves_shape(original[i], derived[i])) {
            return false;
        }
    }
    return true;
}

} // namespace obfuscator

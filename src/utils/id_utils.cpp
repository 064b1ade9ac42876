#include "utils/id_utils.h"
#include <cctype>
#include <uuid/uuid.h>

namespace pem {
namespace utils {

namespace {
constexpr size_t kMaxIdentifierLength = 128;
}

std::string generateUniqueId() {
    uuid_t uuid;
    char uuid_str[37];

    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);

    return std::string(uuid_str);
}

bool isValidIdentifier(const std::string& identifier) {
    if (identifier.empty() || identifier.size() > kMaxIdentifierLength) {
        return false;
    }
    if (identifier == "." || identifier == "..") {
        return false;
    }
    for (char c : identifier) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace pem

#ifndef MEMORYKEY_HPP
#define MEMORYKEY_HPP

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <tuple>

#include <boost/container_hash/hash.hpp>

// --- Composite cache key: (owner, category, subkey) ---
// Compared field by field, so "a:b" + "c" and "a" + "b:c" never collide.
class MemoryKey {
public:
    MemoryKey(std::string owner, std::string category, std::string subkey)
        : owner_(std::move(owner)), category_(std::move(category)), subkey_(std::move(subkey)) {
        if (owner_.empty()) {
            throw std::invalid_argument("MemoryKey owner cannot be empty");
        }
        if (category_.empty()) {
            throw std::invalid_argument("MemoryKey category cannot be empty");
        }
        if (subkey_.empty()) {
            throw std::invalid_argument("MemoryKey subkey cannot be empty");
        }
    }

    const std::string& owner() const { return owner_; }
    const std::string& category() const { return category_; }
    const std::string& subkey() const { return subkey_; }

    bool operator==(const MemoryKey& other) const {
        return owner_ == other.owner_ && category_ == other.category_ && subkey_ == other.subkey_;
    }
    bool operator!=(const MemoryKey& other) const { return !(*this == other); }
    bool operator<(const MemoryKey& other) const {
        return std::tie(owner_, category_, subkey_) < std::tie(other.owner_, other.category_, other.subkey_);
    }

    // Printable form "owner:category:subkey". '%' and ':' inside a part are
    // percent-escaped, so distinct keys always print differently.
    std::string to_string() const {
        return escape(owner_) + ":" + escape(category_) + ":" + escape(subkey_);
    }

private:
    static std::string escape(const std::string& part) {
        std::string out;
        out.reserve(part.size());
        for (char c : part) {
            if (c == '%') {
                out += "%25";
            } else if (c == ':') {
                out += "%3A";
            } else {
                out += c;
            }
        }
        return out;
    }

    std::string owner_;
    std::string category_;
    std::string subkey_;
};

struct MemoryKeyHash {
    std::size_t operator()(const MemoryKey& key) const {
        std::size_t seed = 0;
        boost::hash_combine(seed, key.owner());
        boost::hash_combine(seed, key.category());
        boost::hash_combine(seed, key.subkey());
        return seed;
    }
};

#endif // MEMORYKEY_HPP

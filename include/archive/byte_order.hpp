#ifndef GUIDSTORE_BYTE_ORDER_HPP
#define GUIDSTORE_BYTE_ORDER_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <type_traits>

namespace guidstore::archive {

// ZIP records are little endian regardless of host order. Values are composed
// byte by byte so the helpers are independent of host endianness.
class ByteOrder {
public:
    // Appends value to out as sizeof(T) little endian bytes
    template<typename T>
    static void putLittleEndian(std::string& out, T value) {
        static_assert(std::is_unsigned<T>::value, "unsigned integer expected");
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
        }
    }

    // Reads sizeof(T) little endian bytes starting at data
    template<typename T>
    static T getLittleEndian(const char* data) {
        static_assert(std::is_unsigned<T>::value, "unsigned integer expected");
        T value = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(static_cast<uint8_t>(data[i])) << (8 * i);
        }
        return value;
    }
};

} // namespace guidstore::archive

#endif // GUIDSTORE_BYTE_ORDER_HPP

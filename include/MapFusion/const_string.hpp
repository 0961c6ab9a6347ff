#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace MapFusion {

// String literal usable as a template argument: key<"lat">, cast<"to_i">, ...
template <typename CharT, std::size_t N> struct ConstString
{
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i <= N; i ++) {
            m_data[i] = str[i];
        }
    }

    // Map keys and names are printable text
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(static_cast<std::uint8_t>(m_data[i]) < 32) return false;
        }
        return true;
    }
    constexpr bool empty() const {
        return N == 0;
    }
    constexpr std::string_view toStringView() const {
        return {m_data, N};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

}

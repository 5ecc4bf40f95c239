#include "Base58.h"
#include <algorithm>
#include <array>
#include <vector>

namespace shieldpool {
namespace ledger {

namespace {

constexpr char alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Anything longer cannot be a key or a signature.
constexpr std::size_t maxDecodeLength = 128;

constexpr std::array<std::int8_t, 128>
makeIndex()
{
    std::array<std::int8_t, 128> index{};
    for (auto& v : index)
        v = -1;
    for (std::int8_t i = 0; i < 58; ++i)
        index[static_cast<unsigned char>(alphabet[i])] = i;
    return index;
}

constexpr auto alphabetIndex = makeIndex();

} // namespace

std::string
encodeBase58(ripple::Slice data)
{
    auto begin = data.data();
    auto const end = data.data() + data.size();

    std::size_t zeroes = 0;
    while (begin != end && *begin == 0)
    {
        ++begin;
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    std::vector<std::uint8_t> b58((end - begin) * 138 / 100 + 1);
    std::size_t length = 0;
    for (; begin != end; ++begin)
    {
        int carry = *begin;
        std::size_t i = 0;
        for (auto it = b58.rbegin(); (carry != 0 || i < length) && it != b58.rend(); ++it, ++i)
        {
            carry += 256 * (*it);
            *it = carry % 58;
            carry /= 58;
        }
        length = i;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0)
        ++it;

    std::string result(zeroes, '1');
    result.reserve(zeroes + (b58.end() - it));
    for (; it != b58.end(); ++it)
        result += alphabet[*it];
    return result;
}

std::optional<ripple::Blob>
decodeBase58(std::string_view text)
{
    if (text.size() > maxDecodeLength)
        return std::nullopt;

    std::size_t zeroes = 0;
    while (zeroes < text.size() && text[zeroes] == '1')
        ++zeroes;

    // log(58) / log(256), rounded up
    std::vector<std::uint8_t> b256(text.size() * 733 / 1000 + 1);
    std::size_t length = 0;
    for (std::size_t pos = zeroes; pos < text.size(); ++pos)
    {
        auto const c = static_cast<unsigned char>(text[pos]);
        if (c >= alphabetIndex.size() || alphabetIndex[c] < 0)
            return std::nullopt;

        int carry = alphabetIndex[c];
        std::size_t i = 0;
        for (auto it = b256.rbegin(); (carry != 0 || i < length) && it != b256.rend(); ++it, ++i)
        {
            carry += 58 * (*it);
            *it = carry % 256;
            carry /= 256;
        }
        if (carry != 0)
            return std::nullopt;
        length = i;
    }

    auto it = b256.begin() + (b256.size() - length);
    while (it != b256.end() && *it == 0)
        ++it;

    ripple::Blob result(zeroes, 0);
    result.insert(result.end(), it, b256.end());
    return result;
}

} // namespace ledger
} // namespace shieldpool

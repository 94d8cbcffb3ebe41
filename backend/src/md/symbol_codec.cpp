#include "symbol_codec.hpp"

#include <cctype>

static std::string lower(std::string s)
{
    for (auto &ch : s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string SymbolCodec::normalize(std::string s)
{
    for (auto &ch : s)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

std::string SymbolCodec::to_instrument(const std::string &c, const std::string &quote)
{
    return normalize(c) + normalize(quote);
}

std::string SymbolCodec::to_stream(const std::string &c, const std::string &quote)
{
    return lower(to_instrument(c, quote));
}

std::string SymbolCodec::to_canonical(const std::string &v, const std::string &quote)
{
    std::string up = normalize(v);
    const std::string q = normalize(quote);
    if (!q.empty() && up.size() > q.size() &&
        up.compare(up.size() - q.size(), q.size(), q) == 0)
    {
        up.erase(up.size() - q.size());
    }
    return up;
}

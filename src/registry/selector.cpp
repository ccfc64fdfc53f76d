#include "simpaths/registry/selector.hpp"

#include <fmt/format.h>

namespace simpaths::registry
{

Outcome<Selector> make_selector(std::optional<std::vector<std::string>> paths, std::optional<std::string> pattern)
{
    if (paths && pattern)
        return Outcome<Selector>::failure("paths and pattern are mutually exclusive; supply at most one");
    if (paths)
        return Outcome<Selector>::success(SelectPaths{std::move(*paths)});
    if (pattern)
        return Outcome<Selector>::success(SelectPattern{std::move(*pattern)});
    return Outcome<Selector>::success(SelectAll{});
}

bool GlobMatcher::Token::accepts(char c) const noexcept
{
    switch (kind)
    {
    case Kind::Literal:
        return c == ch;
    case Kind::AnyChar:
    case Kind::AnyRun:
        return true;
    case Kind::Class:
        break;
    }
    const auto u = static_cast<unsigned char>(c);
    bool in = members.find(c) != std::string::npos;
    for (const auto &[lo, hi] : ranges)
        in = in || (lo <= u && u <= hi);
    return in != negate;
}

Outcome<GlobMatcher> GlobMatcher::compile(std::string_view glob)
{
    using Kind = Token::Kind;
    std::vector<Token> tokens;
    const std::size_t n = glob.size();
    std::size_t i = 0;
    while (i < n)
    {
        const char c = glob[i++];
        Token tok;
        if (c == '*')
        {
            while (i < n && glob[i] == '*')
                ++i;
            tok.kind = Kind::AnyRun;
        }
        else if (c == '?')
        {
            tok.kind = Kind::AnyChar;
        }
        else if (c == '[')
        {
            std::size_t j = i;
            if (j < n && glob[j] == '!')
                ++j;
            if (j < n && glob[j] == ']')
                ++j;
            while (j < n && glob[j] != ']')
                ++j;
            if (j >= n)
            {
                tok.ch = '[';
                tokens.push_back(std::move(tok));
                continue;
            }
            std::string_view body = glob.substr(i, j - i);
            i = j + 1;

            tok.kind = Kind::Class;
            if (!body.empty() && body.front() == '!')
            {
                tok.negate = true;
                body.remove_prefix(1);
            }
            for (std::size_t k = 0; k < body.size();)
            {
                if (k + 2 < body.size() && body[k + 1] == '-')
                {
                    const auto lo = static_cast<unsigned char>(body[k]);
                    const auto hi = static_cast<unsigned char>(body[k + 2]);
                    if (lo > hi)
                        return Outcome<GlobMatcher>::failure(
                            fmt::format("invalid pattern '{}': bad character range {}-{}", glob, body[k], body[k + 2]));
                    tok.ranges.emplace_back(lo, hi);
                    k += 3;
                }
                else
                {
                    tok.members += body[k++];
                }
            }
        }
        else
        {
            tok.ch = c;
        }
        tokens.push_back(std::move(tok));
    }
    return Outcome<GlobMatcher>::success(GlobMatcher(std::string(glob), std::move(tokens)));
}

bool GlobMatcher::matches(std::string_view candidate) const noexcept
{
    // Greedy scan; on a mismatch, retry from the most recent '*' one character later.
    constexpr std::size_t kNone = static_cast<std::size_t>(-1);
    std::size_t t = 0;
    std::size_t i = 0;
    std::size_t star_t = kNone;
    std::size_t star_i = 0;
    while (i < candidate.size())
    {
        if (t < m_tokens.size() && m_tokens[t].kind == Token::Kind::AnyRun)
        {
            star_t = t++;
            star_i = i;
        }
        else if (t < m_tokens.size() && m_tokens[t].accepts(candidate[i]))
        {
            ++t;
            ++i;
        }
        else if (star_t != kNone)
        {
            t = star_t + 1;
            i = ++star_i;
        }
        else
        {
            return false;
        }
    }
    while (t < m_tokens.size() && m_tokens[t].kind == Token::Kind::AnyRun)
        ++t;
    return t == m_tokens.size();
}

} // namespace simpaths::registry

/**
 * @file selector.hpp
 * @brief Entry selection for info queries, and shell-glob matching.
 *
 * A Selector is built once at the boundary with make_selector(), which is the
 * only place the "both paths and pattern" conflict can arise.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "simpaths/platform.hpp"
#include "simpaths/registry/outcome.hpp"

namespace simpaths::registry
{

struct SelectAll
{
};

/// Explicit keys; results keep this order and skip unknown keys.
struct SelectPaths
{
    std::vector<std::string> paths;
};

/// Shell glob; results are sorted by path.
struct SelectPattern
{
    std::string glob;
};

using Selector = std::variant<SelectAll, SelectPaths, SelectPattern>;

/**
 * @brief Builds a selector from optional caller inputs.
 * @return failure if both @p paths and @p pattern are given.
 */
SIMPATHS_EXPORT Outcome<Selector> make_selector(std::optional<std::vector<std::string>> paths,
                                                std::optional<std::string> pattern);

/**
 * @brief Full-string shell glob matcher.
 *
 * Supports `*`, `?`, `[seq]`, `[!seq]` with ranges. `*` also matches '/'.
 * An unterminated '[' matches itself literally; every other character,
 * including '\' and a leading '^' in a class, is literal. Matching is
 * iterative, so its depth does not grow with the candidate's length.
 */
class SIMPATHS_EXPORT GlobMatcher
{
  public:
    /// @return failure with the cause if the glob is malformed (e.g. `[z-a]`).
    static Outcome<GlobMatcher> compile(std::string_view glob);

    bool matches(std::string_view candidate) const noexcept;

    const std::string &glob() const noexcept { return m_glob; }

  private:
    struct Token
    {
        enum class Kind
        {
            Literal,
            AnyChar,
            AnyRun,
            Class
        };
        Kind kind{Kind::Literal};
        char ch{0};
        bool negate{false};
        std::string members;
        std::vector<std::pair<unsigned char, unsigned char>> ranges;

        bool accepts(char c) const noexcept;
    };

    GlobMatcher(std::string glob, std::vector<Token> tokens) : m_glob(std::move(glob)), m_tokens(std::move(tokens)) {}

    std::string m_glob;
    std::vector<Token> m_tokens;
};

} // namespace simpaths::registry

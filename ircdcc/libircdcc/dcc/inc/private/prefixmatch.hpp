#ifndef IRCDCC_DCC_PREFIXMATCH_HPP_
#define IRCDCC_DCC_PREFIXMATCH_HPP_

namespace ircdcc::dcc
{
// Result of looking something up by an abbreviated id or token. An ambiguous prefix is never
// resolved by guessing.
enum class PrefixMatch
{
    FOUND,
    NOT_FOUND,
    AMBIGUOUS
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_PREFIXMATCH_HPP_

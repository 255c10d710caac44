#ifndef TEXTDECODING_HPP
#define TEXTDECODING_HPP

#include <string>
#include <string_view>

/**
 * @brief Best-effort UTF-8 decoding
 *
 * Copies well-formed UTF-8 unchanged and replaces every maximal ill-formed
 * subsequence with U+FFFD (the replacement character), so the result is
 * always valid UTF-8. Overlong forms, surrogates and code points above
 * U+10FFFF count as ill-formed.
 *
 * Example: "a\xC3(b" becomes "a�(b"; a three-byte sequence cut off at
 * the end of the input becomes a single U+FFFD.
 *
 * @param bytes Raw file bytes
 * @return std::string Valid UTF-8 text
 */
std::string decodeUtf8Lossy(std::string_view bytes);

/**
 * @brief Checks whether bytes are well-formed UTF-8
 */
bool isValidUtf8(std::string_view bytes);

/**
 * @brief Case-folded form of a UTF-8 file name, used as a sort key
 *
 * Decodes the name to code points and lower-cases them with the wide ctype
 * facet of a UTF-8 locale, so "Äb" folds to "äb" just like "Ab" folds to
 * "ab". Undecodable bytes map to U+DC80..U+DCFF and are not folded.
 *
 * @param name File name bytes
 * @return std::wstring Folded code points; compare with operator<
 */
std::wstring foldCase(std::string_view name);

#endif // TEXTDECODING_HPP

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <unicode/brkiter.h>
#include <unicode/utext.h>

namespace whichkey::util {

/// Byte offsets of every grapheme cluster boundary in a UTF-8 string,
/// including 0 and text.size(). Falls back to code point boundaries if ICU
/// cannot create a character break iterator.
inline std::vector<size_t> grapheme_boundaries(const std::string& text) {
    std::vector<size_t> bounds;
    if (text.empty()) {
        bounds.push_back(0);
        return bounds;
    }

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> iter(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getDefault(), status));

    UText* utext = nullptr;
    if (U_SUCCESS(status) && iter) {
        utext = utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status);
    }

    if (U_FAILURE(status) || !iter || !utext) {
        if (utext) utext_close(utext);
        for (size_t i = 0; i < text.size(); ++i) {
            if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) bounds.push_back(i);
        }
        bounds.push_back(text.size());
        return bounds;
    }

    // UTF-8 UText reports native indices, i.e. byte offsets
    iter->setText(utext, status);
    for (int32_t pos = iter->first(); pos != icu::BreakIterator::DONE; pos = iter->next()) {
        bounds.push_back(static_cast<size_t>(pos));
    }
    utext_close(utext);
    return bounds;
}

/// Shortens text at a grapheme boundary and appends the ellipsis until
/// fits() accepts it. Returns text unchanged when it already fits, and the
/// bare ellipsis when not even one grapheme fits.
inline std::string truncate_with_ellipsis(const std::string& text,
                                          const std::function<bool(const std::string&)>& fits,
                                          const std::string& ellipsis = "…") {
    if (fits(text)) {
        return text;
    }

    auto bounds = grapheme_boundaries(text);
    // Binary search the longest prefix (excluding the full text) that fits
    size_t lo = 0;
    size_t hi = bounds.size() >= 2 ? bounds.size() - 2 : 0;
    size_t best = 0;
    bool found = false;
    while (lo <= hi && hi < bounds.size()) {
        size_t mid = lo + (hi - lo) / 2;
        std::string candidate = text.substr(0, bounds[mid]) + ellipsis;
        if (fits(candidate)) {
            best = mid;
            found = true;
            lo = mid + 1;
        } else {
            if (mid == 0) break;
            hi = mid - 1;
        }
    }

    if (!found) {
        return ellipsis;
    }
    return text.substr(0, bounds[best]) + ellipsis;
}

}  // namespace whichkey::util

/*********************************************************************************************************************

-CATEGORY-
Name: Unicode
-END-

Character positions in Sift are grapheme cluster indexes.  A SourceText computes the cluster boundaries of its text
once, with ICU's character break iterator, so that conversion between byte offsets and character positions is a
table lookup thereafter.

*********************************************************************************************************************/

#include <sift/unicode.h>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>

#include <algorithm>
#include <climits>

#include "defs.h"

namespace sift {

//********************************************************************************************************************
// Computes cluster boundaries with ICU.  The native index of a UTF-8 UText is the byte offset, so the boundaries can
// be stored directly.

static ERR icu_boundaries(const std::string &Text, std::vector<size_t> &Bounds)
{
   Log log(__FUNCTION__);

   if (Text.size() > size_t(INT32_MAX)) return log.warning(ERR::OutOfRange);

   UErrorCode status = U_ZERO_ERROR;
   std::unique_ptr<icu::BreakIterator> iterator(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
   if (U_FAILURE(status) or (not iterator)) {
      log.warning("Failed to create a character break iterator: %s", u_errorName(status));
      return ERR::NoSupport;
   }

   UText *utext = utext_openUTF8(nullptr, Text.data(), int64_t(Text.size()), &status);
   if (U_FAILURE(status)) {
      log.warning("utext_openUTF8() failed: %s", u_errorName(status));
      return ERR::Args;
   }

   iterator->setText(utext, status);

   if (U_SUCCESS(status)) {
      for (auto pos = iterator->first(); pos != icu::BreakIterator::DONE; pos = iterator->next()) {
         Bounds.push_back(size_t(pos));
      }
   }
   else log.warning("BreakIterator::setText() failed: %s", u_errorName(status));

   iterator.reset();
   utext_close(utext);

   if (U_FAILURE(status)) return ERR::Args;
   return ERR::Okay;
}

//********************************************************************************************************************
// Code point boundaries, used if ICU cannot index the text.

static void codepoint_boundaries(const std::string &Text, std::vector<size_t> &Bounds)
{
   for (size_t i=0; i < Text.size(); ) {
      Bounds.push_back(i);
      i += utf8_char_length(Text.data() + i, Text.size() - i);
   }
   Bounds.push_back(Text.size());
}

//********************************************************************************************************************

SourceText::SourceText(std::string Text) : content(std::move(Text))
{
   Log log("SourceText");

   if (content.empty()) {
      bounds.push_back(0);
      return;
   }

   bounds.reserve(content.size() + 1);
   if (icu_boundaries(content, bounds) != ERR::Okay) {
      log.warning("Falling back to code point indexing for %d bytes of text.", int(content.size()));
      bounds.clear();
      codepoint_boundaries(content, bounds);
   }

   if (bounds.empty() or (bounds.front() != 0)) bounds.insert(bounds.begin(), 0);
   if (bounds.back() != content.size()) bounds.push_back(content.size());
   bounds.shrink_to_fit();

   log.trace("Indexed %d bytes as %d clusters.", int(content.size()), int(length()));
}

//********************************************************************************************************************

size_t SourceText::offset(size_t Index) const
{
   if (Index >= bounds.size()) return content.size();
   return bounds[Index];
}

size_t SourceText::floor(size_t Offset) const
{
   if (Offset >= content.size()) return length();
   auto it = std::upper_bound(bounds.begin(), bounds.end(), Offset);
   return size_t(it - bounds.begin()) - 1;
}

size_t SourceText::ceil(size_t Offset) const
{
   if (Offset >= content.size()) return length();
   auto it = std::lower_bound(bounds.begin(), bounds.end(), Offset);
   return size_t(it - bounds.begin());
}

bool SourceText::is_boundary(size_t Offset) const
{
   return std::binary_search(bounds.begin(), bounds.end(), Offset);
}

std::string_view SourceText::slice(const Span &Range) const
{
   auto start = offset(Range.start);
   auto end = offset(Range.end);
   if (end < start) return std::string_view();
   return std::string_view(content).substr(start, end - start);
}

/*********************************************************************************************************************

-FUNCTION-
UTF8CharLength: Returns the number of bytes used to define a single UTF-8 character.

Returns the total number of bytes used to encode the UTF-8 character at the start of `String`.  Invalid lead bytes
and truncated sequences are treated as single byte characters, so the result is always at least 1 if `Available` is
non-zero.

-INPUT-
cstr String: Pointer to a UTF-8 string.
int Available: Bytes available from String onwards.

-RESULT-
int: The byte length of the character.

*********************************************************************************************************************/

int utf8_char_length(const char *String, size_t Available)
{
   if ((not String) or (not Available)) return 0;

   auto lead = uint8_t(String[0]);
   int len;
   if (lead < 0x80) return 1;
   else if ((lead & 0xe0) IS 0xc0) len = 2;
   else if ((lead & 0xf0) IS 0xe0) len = 3;
   else if ((lead & 0xf8) IS 0xf0) len = 4;
   else return 1;

   if (size_t(len) > Available) return 1;
   for (int i=1; i < len; i++) {
      if ((uint8_t(String[i]) & 0xc0) != 0x80) return 1;
   }
   return len;
}

/*********************************************************************************************************************

-FUNCTION-
UTF8Length: Returns the total number of code points in a UTF-8 string.

-INPUT-
cpp(strview) String: A UTF-8 string.

-RESULT-
int: The number of code points.  Note that this is not the number of grapheme clusters.

*********************************************************************************************************************/

size_t utf8_length(std::string_view String)
{
   size_t total = 0;
   for (size_t i=0; i < String.size(); total++) i += utf8_char_length(String.data() + i, String.size() - i);
   return total;
}

} // namespace sift

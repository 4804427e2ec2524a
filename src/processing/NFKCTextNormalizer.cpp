#include "NFKCTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace processing
{

NFKCTextNormalizer::NFKCTextNormalizer(bool case_fold)
    : case_fold_(case_fold)
{
}

std::string NFKCTextNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    int options = UTF8PROC_STABLE | UTF8PROC_COMPAT | UTF8PROC_COMPOSE;
    if (case_fold_)
        options |= UTF8PROC_CASEFOLD;

    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &mapped,
                                        static_cast<utf8proc_option_t>(options));
    if (len < 0 || !mapped)
    {
        PLOG_WARNING << "NFKC normalization failed (" << utf8proc_errmsg(len) << "), comparing raw text";
        std::free(mapped);
        return trim(text);
    }

    std::string normalized(reinterpret_cast<char*>(mapped), static_cast<std::size_t>(len));
    std::free(mapped);
    return trim(normalized);
}

} // namespace processing

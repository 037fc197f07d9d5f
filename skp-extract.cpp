#include <cmath>
#include <cstring>
#include <locale>

#include <boost/locale.hpp>
#include <boost/locale/utf.hpp>

#include "skp.h"


static const char * search_engine_domains[] = {
    "google.com", "www.google.com",
    "bing.com", "www.bing.com",
    "search.yahoo.com", "yahoo.com", "www.yahoo.com",
    "msn.com"
};


// Position just after the first "http://" or "https://" followed by a non-empty host
static std::string::size_type find_host_start(const std::string & url) {
    for (auto pos = url.find("http"); pos != std::string::npos; pos = url.find("http", pos + 1)) {
        auto p = pos + 4;

        if (p < url.size() && url[p] == 's')
            ++ p;

        if (url.compare(p, 3, "://") != 0)
            continue;

        p += 3;

        if (p < url.size() && url[p] != '/')
            return p;
    }

    return std::string::npos;
}

// Position of the value of the first non-empty q= or p= parameter
static std::string::size_type find_keyword_start(const std::string & url) {
    for (std::string::size_type i = 0; i + 3 < url.size(); ++ i) {
        if (url[i] != '?' && url[i] != '&')
            continue;

        if ((url[i+1] == 'q' || url[i+1] == 'p') && url[i+2] == '=' && url[i+3] != '&')
            return i + 3;
    }

    return std::string::npos;
}

// ICU backend gives the full unicode case mapping regardless of installed system locales
static const std::locale & keyword_locale() {
    static const std::locale loc = [] {
        auto backends = boost::locale::localization_backend_manager::global();
        backends.select("icu");

        return boost::locale::generator(backends)("en_US.UTF-8");
    }();

    return loc;
}

static bool is_valid_utf8(const std::string & s) {
    typedef boost::locale::utf::utf_traits<char> utf8;

    for (auto it = s.begin(); it != s.end();) {
        auto c = utf8::decode(it, s.end());

        if (c == boost::locale::utf::illegal || c == boost::locale::utf::incomplete)
            return false;
    }

    return true;
}

static void normalize_keyword(std::string & keyword) {
    std::string res;
    res.reserve(keyword.size());

    bool ascii = true;

    for (std::string::size_type i = 0; i < keyword.size(); ++ i) {
        char c = keyword[i];

        if (c == '+') {
            res.push_back(' ');
        } else if (c == '%' && keyword.compare(i, 3, "%20") == 0) {
            res.push_back(' ');
            i += 2;
        } else if (c >= 'A' && c <= 'Z') {
            res.push_back(c - 'A' + 'a');
        } else {
            if (static_cast<unsigned char>(c) >= 0x80)
                ascii = false;

            res.push_back(c);
        }
    }

    // Raw utf-8 letters in the query need full unicode case mapping, invalid utf-8 keeps ascii lowering
    if (!ascii && is_valid_utf8(res))
        res = boost::locale::to_lower(res, keyword_locale());

    keyword.swap(res);
}


bool skp_extract_domain_and_keyword(const std::string & referrer, std::string & domain, std::string & keyword) {
    domain.clear();
    keyword.clear();

    auto host_start = find_host_start(referrer);

    if (host_start == std::string::npos)
        return false;

    auto host_end = referrer.find('/', host_start);
    domain.assign(referrer, host_start, host_end == std::string::npos ? std::string::npos : host_end - host_start);

    auto kw_start = find_keyword_start(referrer);

    if (kw_start != std::string::npos) {
        auto kw_end = referrer.find('&', kw_start);
        keyword.assign(referrer, kw_start, kw_end == std::string::npos ? std::string::npos : kw_end - kw_start);
        normalize_keyword(keyword);
    }

    return true;
}

bool skp_is_search_engine_domain(const std::string & domain) {
    for (auto name : search_engine_domains)
        if (domain == name)
            return true;

    return false;
}

bool skp_is_purchase_event(const std::string & event_list) {
    std::string::size_type start = 0;

    for (;;) {
        auto end = event_list.find(',', start);
        auto len = (end == std::string::npos ? event_list.size() : end) - start;

        if (len == 1 && event_list[start] == '1')
            return true;

        if (end == std::string::npos)
            return false;

        start = end + 1;
    }
}

skp_double skp_extract_revenue(const std::string & product_list) {
    // category;name;quantity;revenue;events - skip first three fields
    std::string::size_type start = 0;

    for (int i = 0; i < 3; ++ i) {
        auto pos = product_list.find(';', start);

        if (pos == std::string::npos)
            return 0.0;

        start = pos + 1;
    }

    auto end = product_list.find_first_of(";,", start);
    std::string field = product_list.substr(start, end == std::string::npos ? std::string::npos : end - start);

    auto first = field.find_first_not_of(" \t");
    if (first == std::string::npos)
        return 0.0;

    field = field.substr(first, field.find_last_not_of(" \t") + 1 - first);

    // Plain decimal notation only, stod would also take hex, inf and nan
    if (field.find_first_not_of("0123456789+-.eE") != std::string::npos)
        return 0.0;

    skp_double value;
    size_t parsed;

    try {
        value = std::stod(field, &parsed);
    } catch (std::invalid_argument) {
        return 0.0;
    } catch (std::out_of_range) {
        return 0.0;
    }

    if (parsed != field.size() || !std::isfinite(value))
        return 0.0;

    return value;
}

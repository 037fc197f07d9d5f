#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

#include "util/io.h"

typedef uint64_t skp_ulong;
typedef double skp_double;


const skp_ulong skp_default_batch_size = 500000;


// Fatal errors, the run is aborted and no output is produced

class skp_input_error : public std::runtime_error {
public:
    explicit skp_input_error(const std::string & what): std::runtime_error(what) {}
};

class skp_output_error : public std::runtime_error {
public:
    explicit skp_output_error(const std::string & what): std::runtime_error(what) {}
};


// One row of the hit log, only the columns used by attribution
struct skp_hit {
    std::string ip;
    std::string referrer;
    std::string event_list;
    std::string product_list;
};

struct skp_referral_key {
    std::string domain;
    std::string keyword;
};

inline bool operator==(const skp_referral_key & a, const skp_referral_key & b) {
    return a.domain == b.domain && a.keyword == b.keyword;
}

namespace std {
    template <>
    struct hash<skp_referral_key> {
        std::size_t operator()(const skp_referral_key & k) const {
          return std::hash<std::string>()(k.domain) ^ (std::hash<std::string>()(k.keyword) >> 1);
        }
    };
}


struct skp_result_row {
    std::string domain;
    std::string keyword;
    skp_double revenue;
};

typedef std::vector<skp_result_row> skp_result_table;

struct skp_stats {
    skp_ulong rows_processed;
    skp_ulong purchases_found;
    skp_ulong unique_keywords;
    skp_double total_revenue;

    skp_ulong rows_skipped; // Data rows without visitor ip
    skp_ulong referred_visitors; // Size of referral index

    skp_stats(): rows_processed(0), purchases_found(0), unique_keywords(0), total_revenue(0.0), rows_skipped(0), referred_visitors(0) {}
};

struct skp_options {
    uint n_threads;
    bool verbose;

    skp_options(): n_threads(1), verbose(false) {}
};


// Pure per-record extraction functions

// Finds domain and search keyword in referrer url, returns false if there is no http(s) domain.
// Keyword is left empty when no q or p parameter is present.
bool skp_extract_domain_and_keyword(const std::string & referrer, std::string & domain, std::string & keyword);

bool skp_is_search_engine_domain(const std::string & domain);

bool skp_is_purchase_event(const std::string & event_list);

// Revenue of the first product in product list, 0 if absent or unparseable
skp_double skp_extract_revenue(const std::string & product_list);


// Record source, re-readable from the start for every pass

typedef std::function<std::unique_ptr<std::istream>()> skp_stream_factory;

class skp_hit_reader {
    tsv_file file;
    skp_ulong batch_size;

    size_t ip_col, referrer_col, event_list_col, product_list_col;

    std::vector<std::string> row;
public:
    skp_hit_reader(std::unique_ptr<std::istream> stream, skp_ulong batch_size);

    // Fills batch with up to batch_size hits, returns false when the input is exhausted
    bool next_batch(std::vector<skp_hit> & batch);
};

class skp_hit_source {
    skp_stream_factory factory;
    skp_ulong batch_size;
public:
    skp_hit_source(skp_stream_factory factory, skp_ulong batch_size = skp_default_batch_size);

    static skp_hit_source from_file(const std::string & file_name, skp_ulong batch_size = skp_default_batch_size);

    // Opens a fresh reader positioned at the first data row
    skp_hit_reader open() const;

    skp_ulong get_batch_size() const {
        return batch_size;
    }
};


// Visitor ip -> first search referral

class skp_referral_index {
    std::unordered_map<std::string, skp_referral_key> visitors;
    bool complete;
public:
    skp_referral_index(): complete(false) {}

    // Returns false if visitor already has a referral
    bool insert(const std::string & ip, skp_referral_key && key);

    const skp_referral_key * find(const std::string & ip) const;

    void finish() {
        complete = true;
    }

    bool is_complete() const {
        return complete;
    }

    size_t size() const {
        return visitors.size();
    }
};

// Referral key -> total revenue of attributed purchases

class skp_revenue_accumulator {
    std::unordered_map<skp_referral_key, skp_double> revenue;
public:
    typedef std::unordered_map<skp_referral_key, skp_double>::const_iterator const_iterator;

    void add(const skp_referral_key & key, skp_double value);

    const_iterator begin() const {
        return revenue.begin();
    }

    const_iterator end() const {
        return revenue.end();
    }

    size_t size() const {
        return revenue.size();
    }
};


// Passes

void skp_build_referral_index(const skp_hit_source & source, skp_referral_index & index, const skp_options & opts);

void skp_aggregate_revenue(const skp_hit_source & source, const skp_referral_index & index, skp_revenue_accumulator & revenue, skp_stats & stats, const skp_options & opts);


// Results

skp_result_table skp_materialize(const skp_revenue_accumulator & revenue, skp_stats & stats);

void skp_write_result_table(std::ostream & out, const skp_result_table & table);
void skp_write_result_table(const std::string & file_name, const skp_result_table & table);

void skp_write_stats(std::ostream & out, const skp_stats & stats);
void skp_write_stats(const std::string & file_name, const skp_stats & stats);


// Runs both passes over the source and builds the sorted result table
skp_result_table skp_process(const skp_hit_source & source, skp_stats & stats, const skp_options & opts = skp_options());

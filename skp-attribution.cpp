#include <ctime>
#include <iostream>

#include "skp.h"


const skp_ulong progress_step = 5000000;
const skp_ulong max_skip_warnings = 5;


static int thread_count(const skp_options & opts) {
    return opts.n_threads > 0 ? opts.n_threads : 1;
}

static void report_progress(skp_ulong before, skp_ulong after, const skp_options & opts) {
    if (opts.verbose && after / progress_step > before / progress_step) {
        std::cout << (after / 1000000) << "M... ";
        std::cout.flush();
    }
}


bool skp_referral_index::insert(const std::string & ip, skp_referral_key && key) {
    if (complete)
        throw std::logic_error("Referral index is already complete");

    return visitors.emplace(ip, std::move(key)).second;
}

const skp_referral_key * skp_referral_index::find(const std::string & ip) const {
    auto it = visitors.find(ip);

    if (it == visitors.end())
        return nullptr;

    return &it->second;
}


void skp_revenue_accumulator::add(const skp_referral_key & key, skp_double value) {
    if (!(value >= 0))
        throw std::invalid_argument("Revenue must be non-negative");

    revenue[key] += value;
}


void skp_build_referral_index(const skp_hit_source & source, skp_referral_index & index, const skp_options & opts) {
    using namespace std;

    time_t begin = time(nullptr);

    auto reader = source.open();

    if (opts.verbose) {
        cout << "Pass 1: Finding first search referrals... ";
        cout.flush();
    }

    vector<skp_hit> batch;
    vector<skp_referral_key> referrals;
    vector<char> found;

    skp_ulong rows = 0;

    while (reader.next_batch(batch)) {
        long n = batch.size();

        referrals.resize(n);
        found.resize(n);

        // Extraction is pure, only the index insertion below depends on order
        #pragma omp parallel for num_threads(thread_count(opts)) schedule(static)
        for (long i = 0; i < n; ++ i) {
            found[i] = !batch[i].ip.empty()
                && skp_extract_domain_and_keyword(batch[i].referrer, referrals[i].domain, referrals[i].keyword)
                && skp_is_search_engine_domain(referrals[i].domain);
        }

        for (long i = 0; i < n; ++ i)
            if (found[i])
                index.insert(batch[i].ip, move(referrals[i]));

        report_progress(rows, rows + n, opts);
        rows += n;
    }

    index.finish();

    if (opts.verbose)
        cout << "done in " << (time(nullptr) - begin) << " seconds, found " << index.size() << " visitors from search engines" << endl;
}


void skp_aggregate_revenue(const skp_hit_source & source, const skp_referral_index & index, skp_revenue_accumulator & revenue, skp_stats & stats, const skp_options & opts) {
    using namespace std;

    if (!index.is_complete())
        throw logic_error("Revenue aggregation requires a complete referral index");

    time_t begin = time(nullptr);

    auto reader = source.open();

    if (opts.verbose) {
        cout << "Pass 2: Aggregating revenue... ";
        cout.flush();
    }

    vector<skp_hit> batch;
    vector<char> purchase;
    vector<skp_double> purchase_revenue;

    while (reader.next_batch(batch)) {
        long n = batch.size();

        purchase.resize(n);
        purchase_revenue.resize(n);

        #pragma omp parallel for num_threads(thread_count(opts)) schedule(static)
        for (long i = 0; i < n; ++ i) {
            purchase[i] = skp_is_purchase_event(batch[i].event_list);
            purchase_revenue[i] = purchase[i] ? skp_extract_revenue(batch[i].product_list) : 0.0;
        }

        // Accumulate serially in file order, so sums don't depend on thread count
        for (long i = 0; i < n; ++ i) {
            auto & hit = batch[i];

            if (hit.ip.empty()) {
                if (opts.verbose && stats.rows_skipped < max_skip_warnings)
                    cerr << "Warning: skipping data row " << (stats.rows_processed + i + 1) << " without ip" << endl;

                stats.rows_skipped ++;
                continue;
            }

            if (!purchase[i] || !(purchase_revenue[i] > 0))
                continue;

            auto key = index.find(hit.ip);

            if (key == nullptr)
                continue;

            revenue.add(*key, purchase_revenue[i]);
            stats.purchases_found ++;
        }

        report_progress(stats.rows_processed, stats.rows_processed + n, opts);
        stats.rows_processed += n;
    }

    if (opts.verbose) {
        cout << "done in " << (time(nullptr) - begin) << " seconds, processed " << stats.rows_processed << " rows, " << stats.purchases_found << " purchases" << endl;

        if (stats.rows_skipped > 0)
            cerr << "Warning: " << stats.rows_skipped << " rows without ip were skipped" << endl;
    }
}

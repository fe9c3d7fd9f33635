/*
/   Accumulation of per-realization localization lengths:
/   running sums for the means, and the raw samples indexed by
/   realization number, from which the spread is computed.
*/

#pragma once

#include <armadillo>
#include <localization.h>

class LocalizationAccumulator {
private:
    int count_ = 0;
    double sum_lx2_ = 0.0, sum_ly2_ = 0.0;

    // per realization, NaN where this accumulator did not run the realization
    arma::vec lx2_;
    arma::vec ly2_;

    // sample standard deviation over the realizations that ran
    static double std_dev(const arma::vec& samples);

public:
    LocalizationAccumulator() = default;
    explicit LocalizationAccumulator(int n_realizations);

    void add(int realization, const LocalizationSample& sample);

    // combine the work of another accumulator over the same realization range
    void merge(const LocalizationAccumulator& other);

    int count() const { return count_; }
    double mean_lx2() const;
    double mean_ly2() const;
    double stddev_lx2() const;
    double stddev_ly2() const;
    double stderr_lx2() const;
    double stderr_ly2() const;

    const arma::vec& samples_lx2() const { return lx2_; }
    const arma::vec& samples_ly2() const { return ly2_; }

    // raw sums, for reductions
    arma::vec2 sums() const { return {sum_lx2_, sum_ly2_}; }
    void set_totals(int count, const arma::vec2& sums, const arma::vec& lx2, const arma::vec& ly2);
};

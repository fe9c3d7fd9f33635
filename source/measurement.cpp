#include <measurement.h>
#include <cmath>
#include <limits>

LocalizationAccumulator::LocalizationAccumulator(int n_realizations) {
    if (n_realizations < 0) {
        throw ConfigurationError("Number of realizations must be non-negative.");
    }
    lx2_.set_size(n_realizations);
    ly2_.set_size(n_realizations);
    lx2_.fill(arma::datum::nan);
    ly2_.fill(arma::datum::nan);
}

void LocalizationAccumulator::add(int realization, const LocalizationSample& sample) {
    if (realization < 0 || realization >= static_cast<int>(lx2_.n_elem)) {
        throw std::out_of_range("Realization index is out of range.");
    }
    lx2_(realization) = sample.lx2;
    ly2_(realization) = sample.ly2;
    count_ += 1;
    sum_lx2_ += sample.lx2;
    sum_ly2_ += sample.ly2;
}

void LocalizationAccumulator::merge(const LocalizationAccumulator& other) {
    if (other.lx2_.n_elem != lx2_.n_elem) {
        throw DimensionError("Cannot merge accumulators over different realization ranges.");
    }
    for (arma::uword r = 0; r < other.lx2_.n_elem; ++r) {
        if (std::isnan(other.lx2_(r))) continue;
        lx2_(r) = other.lx2_(r);
        ly2_(r) = other.ly2_(r);
    }
    count_ += other.count_;
    sum_lx2_ += other.sum_lx2_;
    sum_ly2_ += other.sum_ly2_;
}

void LocalizationAccumulator::set_totals(int count, const arma::vec2& sums, const arma::vec& lx2, const arma::vec& ly2) {
    count_ = count;
    sum_lx2_ = sums(0);
    sum_ly2_ = sums(1);
    lx2_ = lx2;
    ly2_ = ly2;
}

double LocalizationAccumulator::mean_lx2() const {
    if (count_ == 0) throw NumericalError("No realizations accumulated.");
    return sum_lx2_ / count_;
}

double LocalizationAccumulator::mean_ly2() const {
    if (count_ == 0) throw NumericalError("No realizations accumulated.");
    return sum_ly2_ / count_;
}

double LocalizationAccumulator::std_dev(const arma::vec& samples) {
    /*
        two-pass sample standard deviation (n - 1 normalization)
    */
    const arma::vec ran = samples.elem(arma::find_finite(samples));
    if (ran.n_elem < 2) return std::numeric_limits<double>::quiet_NaN();
    return arma::stddev(ran);
}

double LocalizationAccumulator::stddev_lx2() const { return std_dev(lx2_); }
double LocalizationAccumulator::stddev_ly2() const { return std_dev(ly2_); }

// sd / sqrt(n)
double LocalizationAccumulator::stderr_lx2() const { return stddev_lx2() / std::sqrt(static_cast<double>(count_)); }
double LocalizationAccumulator::stderr_ly2() const { return stddev_ly2() / std::sqrt(static_cast<double>(count_)); }

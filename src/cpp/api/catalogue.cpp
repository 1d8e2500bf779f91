#include "catalogue.hpp"

#include <algorithm>

namespace statkit::api {

std::string FunctionEntry::to_string() const {
    return "FunctionEntry(name=" + name + ", category=" + category_name(category) + ")";
}

const std::vector<FunctionEntry>& function_catalogue() {
    static const std::vector<FunctionEntry> entries = {
        // Accumulator
        {"Accumulator", Category::Accumulator, "Incremental Welford mean/variance accumulator"},
        {"welford", Category::Accumulator, "One-pass mean, sample variance and count"},

        // Descriptive
        {"mean", Category::Descriptive, "Arithmetic mean"},
        {"var", Category::Descriptive, "Sample variance (ddof = 1)"},
        {"std_dev", Category::Descriptive, "Sample standard deviation (ddof = 1)"},
        {"zscore", Category::Descriptive, "Standardize every element"},
        {"mean_nan", Category::Descriptive, "Mean ignoring NaN"},
        {"var_nan", Category::Descriptive, "Sample variance ignoring NaN"},
        {"std_nan", Category::Descriptive, "Sample standard deviation ignoring NaN"},
        {"quantile", Category::Descriptive, "Linearly interpolated quantile, q in [0, 1]"},
        {"percentile", Category::Descriptive, "Linearly interpolated percentile, q in [0, 100]"},
        {"median", Category::Descriptive, "Median"},
        {"iqr", Category::Descriptive, "Lower quartile, upper quartile and their difference"},
        {"mad", Category::Descriptive, "Median absolute deviation"},
        {"trimmed_mean", Category::Descriptive, "Mean after cutting both tails"},
        {"mean_axis", Category::Descriptive, "Matrix means along axis 0 or 1"},
        {"sign_mask", Category::Descriptive, "Sign of each element as -1, 0 or +1"},
        {"demean_with_signs", Category::Descriptive, "Residuals from the mean and their signs"},
        {"pad_nan", Category::Descriptive, "Sequence of NaN values"},

        // Robust
        {"minmax_scale", Category::Robust, "Scale to [0, 1]"},
        {"robust_scale", Category::Robust, "Center on the median, scale by the MAD"},
        {"winsorize", Category::Robust, "Clip to a quantile range"},
        {"quantile_bins", Category::Robust, "Equal-frequency bin index per element"},
        {"iqr_outliers", Category::Robust, "Tukey fence outlier flags"},
        {"zscore_outliers", Category::Robust, "Z-score threshold outlier flags"},

        // Rolling
        {"rolling_mean", Category::Rolling, "Sliding-window mean"},
        {"rolling_var", Category::Rolling, "Sliding-window sample variance"},
        {"rolling_std", Category::Rolling, "Sliding-window sample standard deviation"},
        {"rolling_zscore", Category::Rolling, "Z-score of the newest element in each window"},
        {"rolling_mean_std", Category::Rolling, "Sliding-window mean and std in one pass"},
        {"ewma", Category::Rolling, "Exponentially weighted moving average"},
        {"rolling_mean_nan", Category::Rolling, "Sliding-window mean ignoring NaN"},
        {"rolling_var_nan", Category::Rolling, "Sliding-window variance ignoring NaN"},
        {"rolling_std_nan", Category::Rolling, "Sliding-window std ignoring NaN"},
        {"rolling_zscore_nan", Category::Rolling, "Sliding-window z-score ignoring NaN"},
        {"rolling_mean_axis0", Category::Rolling, "Column-wise sliding-window mean"},
        {"rolling_var_axis0", Category::Rolling, "Column-wise sliding-window variance"},
        {"rolling_std_axis0", Category::Rolling, "Column-wise sliding-window std"},
        {"rolling_mean_std_axis0", Category::Rolling, "Column-wise sliding-window mean and std"},

        // Pairwise
        {"cov", Category::Pairwise, "Sample covariance of two sequences"},
        {"corr", Category::Pairwise, "Pearson correlation of two sequences"},
        {"cov_nan", Category::Pairwise, "Covariance over complete pairs"},
        {"corr_nan", Category::Pairwise, "Correlation over complete pairs"},
        {"cov_matrix", Category::Pairwise, "Covariance matrix of the columns"},
        {"corr_matrix", Category::Pairwise, "Correlation matrix of the columns"},
        {"cov_matrix_nan", Category::Pairwise, "Pairwise-complete covariance matrix"},
        {"corr_matrix_nan", Category::Pairwise, "Pairwise-complete correlation matrix"},
        {"rolling_cov", Category::Pairwise, "Sliding-window covariance"},
        {"rolling_corr", Category::Pairwise, "Sliding-window correlation"},
        {"rolling_cov_nan", Category::Pairwise, "Sliding-window covariance over complete pairs"},
        {"rolling_corr_nan", Category::Pairwise, "Sliding-window correlation over complete pairs"},

        // Transforms
        {"diff", Category::Transform, "Lagged difference"},
        {"pct_change", Category::Transform, "Lagged relative change"},
        {"cumsum", Category::Transform, "Prefix sums"},
        {"cummean", Category::Transform, "Prefix means"},
        {"ecdf", Category::Transform, "Empirical cumulative distribution function"},
        {"kde_gaussian", Category::Transform, "Gaussian kernel density on a grid"},
        {"silverman_bandwidth", Category::Transform, "Silverman rule-of-thumb bandwidth"},

        // Inference
        {"t_test_1samp", Category::Inference, "One-sample t-test"},
        {"t_test_2samp", Category::Inference, "Two-sample t-test (pooled or Welch)"},
        {"chi2_gof", Category::Inference, "Chi-square goodness-of-fit test"},
        {"chi2_independence", Category::Inference, "Chi-square test of independence"},
        {"cohens_d", Category::Inference, "Cohen's d effect size"},
        {"hedges_g", Category::Inference, "Hedges' g effect size"},
        {"mann_whitney_u", Category::Inference, "Mann-Whitney U rank test"},

        // Configuration
        {"set_num_threads", Category::Configuration, "Set the intra-call thread count"},
        {"get_num_threads", Category::Configuration, "Intra-call thread count in effect"},
        {"openmp_enabled", Category::Configuration, "Whether OpenMP support was compiled in"},
    };
    return entries;
}

std::optional<FunctionEntry> find_function(const std::string& name) {
    const auto& entries = function_catalogue();
    const auto it = std::find_if(entries.begin(), entries.end(),
                                 [&name](const FunctionEntry& e) { return e.name == name; });
    if (it == entries.end()) {
        return std::nullopt;
    }
    return *it;
}

std::string category_name(Category category) {
    switch (category) {
        case Category::Accumulator:
            return "accumulator";
        case Category::Descriptive:
            return "descriptive";
        case Category::Robust:
            return "robust";
        case Category::Rolling:
            return "rolling";
        case Category::Pairwise:
            return "pairwise";
        case Category::Transform:
            return "transform";
        case Category::Inference:
            return "inference";
        case Category::Configuration:
            return "configuration";
    }
    return "unknown";
}

std::vector<std::string> exported_names() {
    const auto& entries = function_catalogue();
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& e : entries) {
        names.push_back(e.name);
    }
    return names;
}

} // namespace statkit::api

#include "signals.hpp"
#include "indicators.hpp"
#include "support.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace {
    constexpr std::size_t kRsiPeriod = 14;
    constexpr std::size_t kMacdMinBars = 35;
    constexpr std::size_t kMacdHistogramStart = 33;  // slow + signal - 2
    constexpr std::size_t kYearBars = 252;

    TechnicalSignal make_signal(const std::string& name,
                                SignalGroup group,
                                int points,
                                const std::string& description,
                                double value) {
        TechnicalSignal signal;
        signal.name = name;
        signal.category = SignalCategory::Technical;
        signal.group = group;
        signal.points = points;
        signal.description = description;
        signal.value = value;
        return signal;
    }

    double last(const std::vector<double>& series) {
        return series.empty() ? std::nan("") : series.back();
    }

    double mean(std::vector<double>::const_iterator first, std::vector<double>::const_iterator end) {
        double sum = 0.0;
        std::size_t count = 0;
        for (auto it = first; it != end; ++it) {
            sum += *it;
            ++count;
        }
        return count > 0 ? sum / static_cast<double>(count) : 0.0;
    }
}

std::vector<TechnicalSignal> apply_group_caps(const std::vector<TechnicalSignal>& signals,
                                              const std::map<SignalGroup, int>& caps) {
    std::map<SignalGroup, int> used;
    std::vector<TechnicalSignal> capped;
    capped.reserve(signals.size());

    for (const auto& signal : signals) {
        TechnicalSignal counted = signal;
        auto cap = caps.find(signal.group);
        if (cap != caps.end()) {
            int remaining = std::max(0, cap->second - used[signal.group]);
            counted.points = std::min(signal.points, remaining);
            used[signal.group] += counted.points;
        }
        capped.push_back(counted);
    }
    return capped;
}

int total_points(const std::vector<TechnicalSignal>& signals) {
    int total = 0;
    for (const auto& signal : signals) {
        total += signal.points;
    }
    return total;
}

std::optional<TechnicalSignal> check_rsi_divergence(const std::vector<double>& closes, std::size_t lookback) {
    if (lookback == 0 || closes.size() < lookback + kRsiPeriod) {
        return std::nullopt;
    }

    auto rsi = rolling_rsi_series(closes, kRsiPeriod);
    std::size_t offset = closes.size() - lookback;
    std::vector<double> recent(closes.begin() + offset, closes.end());

    auto lows = find_swing_lows(recent, 2, 3);
    if (lows.size() < 2) {
        return std::nullopt;
    }

    double price1 = recent[lows.front()];
    double price2 = recent[lows.back()];
    double rsi1 = rsi[offset + lows.front()];
    double rsi2 = rsi[offset + lows.back()];
    if (!std::isfinite(rsi1) || !std::isfinite(rsi2)) {
        return std::nullopt;
    }

    if (price2 < price1 * 0.99 && rsi2 > rsi1 + 3.0) {
        return make_signal("Bullish RSI Divergence", SignalGroup::Momentum, 8,
                           "Price lower low but RSI higher low - reversal signal", rsi2);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> check_macd_divergence(const std::vector<double>& closes, std::size_t lookback) {
    if (lookback == 0 || closes.size() < kMacdHistogramStart + lookback) {
        return std::nullopt;
    }

    auto macd = macd_series(closes);
    std::size_t offset = closes.size() - lookback;
    std::vector<double> recent(closes.begin() + offset, closes.end());

    auto lows = find_swing_lows(recent, 2, 3);
    if (lows.size() < 2) {
        return std::nullopt;
    }

    double price1 = recent[lows.front()];
    double price2 = recent[lows.back()];
    double hist1 = macd[offset + lows.front()].histogram;
    double hist2 = macd[offset + lows.back()].histogram;
    if (!std::isfinite(hist1) || !std::isfinite(hist2)) {
        return std::nullopt;
    }

    if (price2 < price1 * 0.99 && hist2 > hist1) {
        return make_signal("Bullish MACD Divergence", SignalGroup::MovingAverage, 6,
                           "Price lower low but MACD higher low - momentum building", hist2);
    }
    return std::nullopt;
}

TechnicalSignalDetector::TechnicalSignalDetector(const SignalConfig& config) : config_(config) {}

TechnicalResult TechnicalSignalDetector::detect(const std::vector<PriceBar>& bars) const {
    TechnicalResult result;
    if (bars.size() < config_.min_bars) {
        spdlog::debug("Technical signals skipped: {} bars, need {}", bars.size(), config_.min_bars);
        return result;
    }

    std::vector<double> closes;
    std::vector<double> volumes;
    closes.reserve(bars.size());
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
        volumes.push_back(bar.volume);
    }

    double price = closes.back();
    if (!is_finite_positive(price)) {
        spdlog::warn("Technical signals skipped: last close {} is not a usable price", price);
        return result;
    }

    auto& signals = result.signals;
    auto add = [&signals](const std::optional<TechnicalSignal>& signal) {
        if (signal) {
            signals.push_back(*signal);
        }
    };
    auto add_all = [&signals](const std::vector<TechnicalSignal>& found) {
        signals.insert(signals.end(), found.begin(), found.end());
    };

    if (config_.style == SpreadStrategy::CreditSpread) {
        // Stability set: no pullback, 52-week low or divergence signals
        add(check_rsi(closes));
        add(check_golden_cross(closes));
        add_all(check_ma_position(price, closes));
        add(check_volume_surge(volumes));
        add(check_obv_trend(closes, volumes));
        add(check_macd(closes));
        add(check_adx(bars));
        add(check_bollinger(price, closes));
    } else {
        add(check_rsi(closes));
        add_all(check_pullback(price, closes));
        add(check_golden_cross(closes));
        add_all(check_ma_position(price, closes));
        add(check_ma_proximity(price, closes));
        add(check_volume_surge(volumes));
        add(check_near_support(price, bars));
        add(check_obv_trend(closes, volumes));
        add(check_macd(closes));
        add(check_52_week(price, closes));
        add(check_adx(bars));
        add(check_bollinger(price, closes));
        add(check_rsi_divergence(closes, config_.divergence_lookback));
        add(check_macd_divergence(closes, config_.divergence_lookback));
    }

    int capped = total_points(apply_group_caps(signals, config_.group_caps));
    result.score = std::max(0, std::min(capped, config_.score_ceiling));

    spdlog::debug("Technical score {} from {} signals ({} before caps)",
                  result.score, signals.size(), total_points(signals));
    return result;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_rsi(const std::vector<double>& closes) const {
    if (closes.size() < kRsiPeriod + 1) {
        return std::nullopt;
    }

    double rsi = last(rsi_series(closes, kRsiPeriod));
    if (!std::isfinite(rsi)) {
        return std::nullopt;
    }

    for (const auto& band : config_.rsi_bands) {
        if (band.matches(rsi)) {
            return make_signal(band.name, SignalGroup::Momentum, band.points,
                               fmt::format("RSI(14) = {:.1f} ({})", rsi, band.label), rsi);
        }
    }
    return std::nullopt;
}

std::vector<TechnicalSignal> TechnicalSignalDetector::check_pullback(double price, const std::vector<double>& closes) const {
    std::vector<TechnicalSignal> signals;
    if (closes.size() < 200) {
        return signals;
    }

    double ma20 = *sma(closes, 20);
    double ma50 = *sma(closes, 50);
    double ma200 = *sma(closes, 200);

    // Long-term uptrend gate
    if (price <= ma200) {
        return signals;
    }

    double dist_ma20 = (price - ma20) / price;
    double dist_ma50 = (price - ma50) / price;
    bool healthy = ma50 > ma200;
    bool strong = ma20 > ma50 && ma50 > ma200;

    // MA pullbacks share the moving-average allowance; only the drawdown
    // from the recent high counts as a pullback
    if (healthy && std::abs(dist_ma50) < 0.03) {
        signals.push_back(make_signal("Pullback to MA50", SignalGroup::MovingAverage, 12,
                                      "Uptrend intact, pulled back to MA50 support", ma50));
    }

    if (strong && std::abs(dist_ma20) < 0.02) {
        signals.push_back(make_signal("Pullback to MA20", SignalGroup::MovingAverage, 8,
                                      "Strong uptrend, testing MA20 support", ma20));
    }

    double high20 = *std::max_element(closes.end() - 20, closes.end());
    double pullback = high20 > 0.0 ? (high20 - price) / high20 : 0.0;
    if (pullback >= 0.05 && pullback <= 0.15) {
        signals.push_back(make_signal("Healthy Pullback", SignalGroup::Pullback, 7,
                                      fmt::format("{:.0f}% pullback from high, trend intact", pullback * 100.0),
                                      pullback));
    }

    return signals;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_golden_cross(const std::vector<double>& closes) const {
    if (closes.size() < 200) {
        return std::nullopt;
    }

    auto ma50 = sma_series(closes, 50);
    auto ma200 = sma_series(closes, 200);
    std::size_t n = closes.size();

    double current50 = ma50[n - 1];
    double current200 = ma200[n - 1];
    if (!(current50 > current200)) {
        return std::nullopt;
    }

    // A fresh cross needs the prior bar's averages too
    double prev50 = ma50[n - 2];
    double prev200 = ma200[n - 2];
    if (std::isfinite(prev50) && std::isfinite(prev200) && prev50 <= prev200) {
        return make_signal("Golden Cross", SignalGroup::MovingAverage, config_.golden_cross_points,
                           "50 SMA crossed above 200 SMA", current200);
    }

    return make_signal("Golden Cross Active", SignalGroup::MovingAverage,
                       static_cast<int>(std::floor(config_.golden_cross_points * 0.6)),
                       "50 SMA above 200 SMA (bullish structure)", current200);
}

std::vector<TechnicalSignal> TechnicalSignalDetector::check_ma_position(double price, const std::vector<double>& closes) const {
    std::vector<TechnicalSignal> signals;
    if (config_.style == SpreadStrategy::CreditSpread) {
        // MA50 is the primary requirement
        if (closes.size() < 50) {
            return signals;
        }
        double ma50 = *sma(closes, 50);
        if (price > ma50) {
            signals.push_back(make_signal("Above MA50", SignalGroup::MovingAverage, config_.ma_position_points,
                                          fmt::format("Price above 50-day MA (${:.2f})", ma50), ma50));
        }
        auto ma200 = sma(closes, 200);
        if (ma200 && price > *ma200) {
            signals.push_back(make_signal("Above MA200", SignalGroup::MovingAverage, 4,
                                          fmt::format("Price above 200-day MA (${:.2f})", *ma200), *ma200));
        }
        return signals;
    }

    if (closes.size() < 20) {
        return signals;
    }

    int above = 0;
    int total = 0;
    for (std::size_t period : {20, 50, 200}) {
        auto ma = sma(closes, period);
        if (!ma) {
            continue;
        }
        ++total;
        if (price > *ma) {
            ++above;
        }

        if (period == 200) {
            if (price > *ma) {
                signals.push_back(make_signal("Above MA200", SignalGroup::MovingAverage, config_.ma_position_points,
                                              fmt::format("Price above 200-day MA (${:.2f})", *ma), *ma));
            } else if (auto reclaim = check_ma200_reclaim(price, closes)) {
                signals.push_back(*reclaim);
            }
        }
    }

    if (total >= 2) {
        double ratio = static_cast<double>(above) / total;
        if (ratio >= 0.66) {
            signals.push_back(make_signal("Strong MA Position", SignalGroup::MovingAverage, config_.ma_position_points,
                                          fmt::format("Price above {}/{} key moving averages", above, total), ratio));
        } else if (ratio >= 0.5) {
            signals.push_back(make_signal("Mixed MA Position", SignalGroup::MovingAverage, 2,
                                          fmt::format("Price above {}/{} moving averages", above, total), ratio));
        }
    }

    return signals;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_ma200_reclaim(double price, const std::vector<double>& closes) const {
    if (closes.size() < 200) {
        return std::nullopt;
    }

    auto ma50_series = sma_series(closes, 50);
    std::size_t n = closes.size();
    double ma50 = ma50_series[n - 1];
    double prev_ma50 = ma50_series[n - 5];
    double ma200 = *sma(closes, 200);

    if (price >= ma200 || ma200 <= 0.0) {
        return std::nullopt;
    }

    double pct_below = (ma200 - price) / ma200 * 100.0;
    if (pct_below > 5.0) {
        return std::nullopt;
    }

    bool ma50_rising = std::isfinite(prev_ma50) && ma50 > prev_ma50;
    bool above_ma50 = price > ma50;
    double recent_low = *std::min_element(closes.end() - 5, closes.end());
    double prev_low = *std::min_element(closes.end() - 10, closes.end() - 5);
    bool higher_lows = recent_low > prev_low;

    int signs = static_cast<int>(ma50_rising) + static_cast<int>(above_ma50) + static_cast<int>(higher_lows);
    if (signs < 2) {
        return std::nullopt;
    }

    int points = signs == 3 ? 8 : 5;
    return make_signal("Near MA200 Reclaim", SignalGroup::MovingAverage, points,
                       fmt::format("{:.1f}% below MA200, {} recovery ({}/3 signs)",
                                   pct_below, signs == 3 ? "strong" : "moderate", signs),
                       pct_below);
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_ma_proximity(double price, const std::vector<double>& closes) const {
    if (closes.size() < 50) {
        return std::nullopt;
    }

    double ma50 = *sma(closes, 50);
    double dist50 = std::abs(price - ma50) / price;
    if (dist50 < 0.03 && price <= ma50) {
        return make_signal("Near MA50 Support", SignalGroup::MovingAverage, 4,
                           fmt::format("Price within {:.1f}% of 50-day MA", dist50 * 100.0), ma50);
    }

    if (auto ma200 = sma(closes, 200)) {
        double dist200 = std::abs(price - *ma200) / price;
        if (dist200 < 0.03 && price <= *ma200) {
            return make_signal("Near MA200 Support", SignalGroup::MovingAverage, 6,
                               fmt::format("Price within {:.1f}% of 200-day MA", dist200 * 100.0), *ma200);
        }
    }

    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_volume_surge(const std::vector<double>& volumes) const {
    if (volumes.size() < 11) {
        return std::nullopt;
    }

    double current = volumes.back();
    double average = mean(volumes.end() - 11, volumes.end() - 1);
    if (!(average > 0.0) || !std::isfinite(current)) {
        return std::nullopt;
    }

    double ratio = current / average;
    if (ratio >= config_.volume_surge_multiplier) {
        return make_signal("Volume Surge", SignalGroup::Volume, 5,
                           fmt::format("Volume {:.1f}x avg ({:.1f}M)", ratio, current / 1'000'000.0), ratio);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_near_support(double price, const std::vector<PriceBar>& bars) const {
    if (bars.size() < 20) {
        return std::nullopt;
    }

    auto nearest = find_nearest_support(price, bars);
    if (!nearest || nearest->distance > config_.near_support_pct) {
        return std::nullopt;
    }

    return make_signal("Near Support", SignalGroup::PricePosition, 5,
                       fmt::format("Price within {:.0f}% of support (${:.2f})",
                                   config_.near_support_pct * 100.0, nearest->level.price),
                       nearest->level.price);
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_obv_trend(const std::vector<double>& closes,
                                                                        const std::vector<double>& volumes) const {
    if (closes.size() < 20 || volumes.size() < 20) {
        return std::nullopt;
    }

    auto obv = obv_series(closes, volumes);
    if (obv.size() < 10) {
        return std::nullopt;
    }

    double recent = mean(obv.end() - 5, obv.end());
    double previous = mean(obv.end() - 10, obv.end() - 5);
    if (recent > previous * 1.05) {
        return make_signal("OBV Uptrend", SignalGroup::Momentum, 5,
                           "On-Balance Volume trending higher", recent);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_macd(const std::vector<double>& closes) const {
    if (closes.size() < kMacdMinBars) {
        return std::nullopt;
    }

    auto macd = macd_series(closes);
    const auto& current = macd[macd.size() - 1];
    const auto& previous = macd[macd.size() - 2];
    if (!std::isfinite(current.signal) || !std::isfinite(previous.signal)) {
        return std::nullopt;
    }

    // MACD points count against the moving-average allowance
    if (current.macd > current.signal && previous.macd <= previous.signal) {
        return make_signal("MACD Bullish", SignalGroup::MovingAverage, 5,
                           "MACD crossed above signal line", current.macd);
    }

    if (current.macd > current.signal && current.macd > 0.0) {
        return make_signal("MACD Positive", SignalGroup::MovingAverage, 3,
                           "MACD above signal and positive", current.macd);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_52_week(double price, const std::vector<double>& closes) const {
    if (closes.size() < kYearBars) {
        return std::nullopt;
    }

    auto range_begin = closes.end() - kYearBars;
    double low = *std::min_element(range_begin, closes.end());
    double high = *std::max_element(range_begin, closes.end());
    double range = high - low;
    if (!(range > 0.0) || !(low > 0.0)) {
        return std::nullopt;
    }

    double position = (price - low) / range;
    double from_low = (price - low) / low;

    if (from_low < 0.1) {
        return make_signal("Near 52-Week Low", SignalGroup::PricePosition, 8,
                           fmt::format("{:.1f}% above 52-week low (${:.2f})", from_low * 100.0, low), low);
    }
    if (position < 0.25) {
        return make_signal("Lower 52-Week Range", SignalGroup::PricePosition, 4,
                           "In bottom 25% of 52-week range", position);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_adx(const std::vector<PriceBar>& bars) const {
    if (bars.size() < 20) {
        return std::nullopt;
    }

    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    for (const auto& bar : bars) {
        highs.push_back(bar.high);
        lows.push_back(bar.low);
        closes.push_back(bar.close);
    }

    double adx = last(adx_series(highs, lows, closes, 14));
    if (!std::isfinite(adx)) {
        return std::nullopt;
    }

    if (config_.style == SpreadStrategy::CreditSpread) {
        if (adx > 20.0 && adx < 35.0) {
            return make_signal("Moderate Trend", SignalGroup::Trend, 4,
                               fmt::format("ADX {:.0f} - moderate trend (ideal for PCS)", adx), adx);
        }
        if (adx >= 35.0) {
            return make_signal("Strong Trend", SignalGroup::Trend, 3,
                               fmt::format("ADX {:.0f} - strong trend (watch for reversals)", adx), adx);
        }
        return std::nullopt;
    }

    if (adx > 30.0) {
        return make_signal("Strong Trend", SignalGroup::Trend, 5,
                           fmt::format("ADX {:.0f} - strong trend in place", adx), adx);
    }
    if (adx > 25.0) {
        return make_signal("Trending", SignalGroup::Trend, 3,
                           fmt::format("ADX {:.0f} - trend developing", adx), adx);
    }
    if (adx < 20.0) {
        return make_signal("Consolidating", SignalGroup::Trend, 2,
                           fmt::format("ADX {:.0f} - ranging, watch for breakout", adx), adx);
    }
    return std::nullopt;
}

std::optional<TechnicalSignal> TechnicalSignalDetector::check_bollinger(double price, const std::vector<double>& closes) const {
    if (closes.size() < 25) {
        return std::nullopt;
    }

    auto band = bollinger(closes, 20, 2.0);
    if (!band) {
        return std::nullopt;
    }

    double width = band->upper - band->lower;
    if (!(width > 0.0)) {
        return std::nullopt;
    }

    double percent_b = (price - band->lower) / width;
    if (config_.style == SpreadStrategy::CreditSpread) {
        if (percent_b >= 0.35 && percent_b <= 0.65) {
            return make_signal("BB Middle Zone", SignalGroup::PricePosition, 3,
                               "Price in middle Bollinger zone - stable", percent_b);
        }
        if (percent_b < 0.15) {
            return make_signal("BB Lower Warning", SignalGroup::PricePosition, 0,
                               "Price near lower Bollinger - risk for PCS", percent_b);
        }
        return std::nullopt;
    }

    if (percent_b < 0.15) {
        return make_signal("Near Lower Bollinger", SignalGroup::PricePosition, 5,
                           "Price near lower band - oversold bounce potential", percent_b);
    }
    if (percent_b < 0.35) {
        return make_signal("Lower Bollinger Zone", SignalGroup::PricePosition, 3,
                           "Price in lower band zone - favorable entry area", percent_b);
    }
    return std::nullopt;
}

#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    double rsi_from_averages(double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            return avg_gain == 0.0 ? 50.0 : 100.0;
        }
        double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    }

    // Wilder smoothing seeded with the plain sum of the first `period` values
    std::vector<double> wilder_sum(const std::vector<double>& values, std::size_t first, std::size_t period) {
        std::vector<double> out(values.size(), kNaN);
        if (values.size() < first + period) {
            return out;
        }
        double running = 0.0;
        for (std::size_t i = first; i < first + period; ++i) {
            running += values[i];
        }
        out[first + period - 1] = running;
        for (std::size_t i = first + period; i < values.size(); ++i) {
            running = running - running / static_cast<double>(period) + values[i];
            out[i] = running;
        }
        return out;
    }
}

std::optional<double> sma(const std::vector<double>& values, std::size_t period) {
    if (period == 0 || values.size() < period) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (std::size_t i = values.size() - period; i < values.size(); ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(period);
}

std::vector<double> sma_series(const std::vector<double>& values, std::size_t period) {
    std::vector<double> out(values.size(), kNaN);
    if (period == 0 || values.size() < period) {
        return out;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= period) {
            sum -= values[i - period];
        }
        if (i + 1 >= period) {
            out[i] = sum / static_cast<double>(period);
        }
    }
    return out;
}

std::vector<double> ema_series(const std::vector<double>& values, std::size_t period) {
    std::vector<double> out(values.size(), kNaN);
    if (period == 0 || values.size() < period) {
        return out;
    }

    double seed = 0.0;
    for (std::size_t i = 0; i < period; ++i) {
        seed += values[i];
    }
    double ema = seed / static_cast<double>(period);
    out[period - 1] = ema;

    double k = 2.0 / (static_cast<double>(period) + 1.0);
    for (std::size_t i = period; i < values.size(); ++i) {
        ema = (values[i] - ema) * k + ema;
        out[i] = ema;
    }
    return out;
}

std::vector<double> rsi_series(const std::vector<double>& closes, std::size_t period) {
    std::vector<double> out(closes.size(), kNaN);
    if (period == 0 || closes.size() <= period) {
        return out;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (std::size_t i = 1; i <= period; ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0) {
            gain_sum += change;
        } else {
            loss_sum -= change;
        }
    }

    double n = static_cast<double>(period);
    double avg_gain = gain_sum / n;
    double avg_loss = loss_sum / n;
    out[period] = rsi_from_averages(avg_gain, avg_loss);

    for (std::size_t i = period + 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (n - 1.0) + gain) / n;
        avg_loss = (avg_loss * (n - 1.0) + loss) / n;
        out[i] = rsi_from_averages(avg_gain, avg_loss);
    }
    return out;
}

std::vector<double> rolling_rsi_series(const std::vector<double>& closes, std::size_t period) {
    std::vector<double> out(closes.size(), kNaN);
    if (period == 0) {
        return out;
    }

    double n = static_cast<double>(period);
    for (std::size_t i = period; i < closes.size(); ++i) {
        double gains = 0.0;
        double losses = 0.0;
        for (std::size_t j = i - period + 1; j <= i; ++j) {
            double change = closes[j] - closes[j - 1];
            if (change >= 0) {
                gains += change;
            } else {
                losses -= change;
            }
        }
        double avg_gain = gains / n;
        double avg_loss = losses / n;
        // A window without losses reads as rs = 100
        double rs = avg_loss == 0.0 ? 100.0 : avg_gain / avg_loss;
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

std::vector<MacdPoint> macd_series(const std::vector<double>& closes,
                                   std::size_t fast,
                                   std::size_t slow,
                                   std::size_t signal) {
    std::vector<MacdPoint> out(closes.size(), MacdPoint{kNaN, kNaN, kNaN});
    if (fast == 0 || slow <= fast || signal == 0 || closes.size() < slow) {
        return out;
    }

    auto fast_ema = ema_series(closes, fast);
    auto slow_ema = ema_series(closes, slow);

    std::vector<double> macd_line;
    macd_line.reserve(closes.size() - slow + 1);
    for (std::size_t i = slow - 1; i < closes.size(); ++i) {
        double value = fast_ema[i] - slow_ema[i];
        out[i].macd = value;
        macd_line.push_back(value);
    }

    auto signal_line = ema_series(macd_line, signal);
    for (std::size_t k = 0; k < signal_line.size(); ++k) {
        if (std::isnan(signal_line[k])) {
            continue;
        }
        std::size_t i = k + slow - 1;
        out[i].signal = signal_line[k];
        out[i].histogram = out[i].macd - signal_line[k];
    }
    return out;
}

std::vector<double> adx_series(const std::vector<double>& highs,
                               const std::vector<double>& lows,
                               const std::vector<double>& closes,
                               std::size_t period) {
    std::size_t n = std::min({highs.size(), lows.size(), closes.size()});
    std::vector<double> out(n, kNaN);
    if (period == 0 || n < 2 * period) {
        return out;
    }

    // Directional movement and true range, defined from bar 1
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    std::vector<double> tr(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        double up = highs[i] - highs[i - 1];
        double down = lows[i - 1] - lows[i];
        plus_dm[i] = (up > down && up > 0) ? up : 0.0;
        minus_dm[i] = (down > up && down > 0) ? down : 0.0;
        tr[i] = std::max({highs[i] - lows[i],
                          std::abs(highs[i] - closes[i - 1]),
                          std::abs(lows[i] - closes[i - 1])});
    }

    auto smooth_tr = wilder_sum(tr, 1, period);
    auto smooth_plus = wilder_sum(plus_dm, 1, period);
    auto smooth_minus = wilder_sum(minus_dm, 1, period);

    std::vector<double> dx(n, kNaN);
    for (std::size_t i = period; i < n; ++i) {
        if (!(smooth_tr[i] > 0.0)) {
            dx[i] = 0.0;
            continue;
        }
        double plus_di = 100.0 * smooth_plus[i] / smooth_tr[i];
        double minus_di = 100.0 * smooth_minus[i] / smooth_tr[i];
        double di_sum = plus_di + minus_di;
        dx[i] = di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    }

    double first = 0.0;
    for (std::size_t i = period; i < 2 * period; ++i) {
        first += dx[i];
    }
    double p = static_cast<double>(period);
    double adx = first / p;
    out[2 * period - 1] = adx;
    for (std::size_t i = 2 * period; i < n; ++i) {
        adx = (adx * (p - 1.0) + dx[i]) / p;
        out[i] = adx;
    }
    return out;
}

std::optional<BollingerBand> bollinger(const std::vector<double>& values, std::size_t period, double std_devs) {
    auto middle = sma(values, period);
    if (!middle) {
        return std::nullopt;
    }

    double variance = 0.0;
    for (std::size_t i = values.size() - period; i < values.size(); ++i) {
        double d = values[i] - *middle;
        variance += d * d;
    }
    double sd = std::sqrt(variance / static_cast<double>(period));
    return BollingerBand{*middle - std_devs * sd, *middle, *middle + std_devs * sd};
}

std::vector<double> obv_series(const std::vector<double>& closes, const std::vector<double>& volumes) {
    std::size_t n = std::min(closes.size(), volumes.size());
    std::vector<double> out;
    out.reserve(n);
    double obv = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) {
            if (closes[i] > closes[i - 1]) {
                obv += volumes[i];
            } else if (closes[i] < closes[i - 1]) {
                obv -= volumes[i];
            }
        }
        out.push_back(obv);
    }
    return out;
}

std::vector<std::size_t> find_swing_lows(const std::vector<double>& values,
                                         std::size_t radius,
                                         std::size_t min_separation) {
    std::vector<std::size_t> lows;
    if (radius == 0 || values.size() < 2 * radius + 1) {
        return lows;
    }

    for (std::size_t i = radius; i + radius < values.size(); ++i) {
        double current = values[i];
        if (!std::isfinite(current)) {
            continue;
        }
        bool is_low = true;
        for (std::size_t k = 1; k <= radius && is_low; ++k) {
            is_low = current < values[i - k] && current < values[i + k];
        }
        if (!is_low) {
            continue;
        }
        if (!lows.empty() && i - lows.back() < min_separation) {
            continue;
        }
        lows.push_back(i);
    }
    return lows;
}

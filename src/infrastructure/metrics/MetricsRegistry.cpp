#include "infrastructure/metrics/MetricsRegistry.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace trafficpulse::infra {

namespace {

bool isValidMetricName(const std::string& name) {
    if (name.empty()) {
        return false;
    }

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) {
            return false;
        }
    }
    return true;
}

void appendValue(std::string& out, double value) {
    if (std::isnan(value)) {
        out += "NaN";
        return;
    }
    if (std::isinf(value)) {
        out += value > 0 ? "+Inf" : "-Inf";
        return;
    }

    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc{}) {
        out.append(buf, ptr);
    } else {
        out += '0';
    }
}

void appendEscaped(std::string& out, const std::string& text, bool escapeQuotes) {
    for (char c : text) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '"' && escapeQuotes) {
            out += "\\\"";
        } else {
            out += c;
        }
    }
}

} // namespace

MetricFamily::MetricFamily(std::string name, std::string help, std::vector<std::string> labelNames,
                           MetricType type)
    : name_(std::move(name)), help_(std::move(help)), labelNames_(std::move(labelNames)),
      type_(type) {}

void MetricFamily::set(const std::vector<std::string>& labelValues, double value) {
    if (labelValues.size() != labelNames_.size()) {
        throw std::invalid_argument("metric " + name_ + " expects " +
                                    std::to_string(labelNames_.size()) + " label values, got " +
                                    std::to_string(labelValues.size()));
    }

    std::lock_guard lock(mutex_);
    series_[labelValues] = value;
}

std::optional<double> MetricFamily::value(const std::vector<std::string>& labelValues) const {
    std::lock_guard lock(mutex_);
    auto it = series_.find(labelValues);
    if (it == series_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MetricFamily::size() const {
    std::lock_guard lock(mutex_);
    return series_.size();
}

void MetricFamily::serialize(std::string& out) const {
    std::lock_guard lock(mutex_);
    if (series_.empty()) {
        return;
    }

    out += "# HELP ";
    out += name_;
    out += ' ';
    appendEscaped(out, help_, false);
    out += '\n';
    out += "# TYPE ";
    out += name_;
    out += type_ == MetricType::Counter ? " counter\n" : " gauge\n";

    for (const auto& [labelValues, value] : series_) {
        out += name_;
        if (!labelNames_.empty()) {
            out += '{';
            for (size_t i = 0; i < labelNames_.size(); ++i) {
                if (i > 0) {
                    out += ',';
                }
                out += labelNames_[i];
                out += "=\"";
                appendEscaped(out, labelValues[i], true);
                out += '"';
            }
            out += '}';
        }
        out += ' ';
        appendValue(out, value);
        out += '\n';
    }
}

std::shared_ptr<MetricFamily> MetricsRegistry::registerGauge(const std::string& name,
                                                             const std::string& help,
                                                             std::vector<std::string> labelNames) {
    return registerFamily(name, help, std::move(labelNames), MetricType::Gauge);
}

std::shared_ptr<MetricFamily>
MetricsRegistry::registerCounter(const std::string& name, const std::string& help,
                                 std::vector<std::string> labelNames) {
    return registerFamily(name, help, std::move(labelNames), MetricType::Counter);
}

std::shared_ptr<MetricFamily> MetricsRegistry::registerFamily(const std::string& name,
                                                              const std::string& help,
                                                              std::vector<std::string> labelNames,
                                                              MetricType type) {
    if (!isValidMetricName(name)) {
        throw std::invalid_argument("invalid metric name: " + name);
    }
    for (const auto& label : labelNames) {
        if (!isValidMetricName(label) || label.find(':') != std::string::npos) {
            throw std::invalid_argument("invalid label name '" + label + "' for metric " + name);
        }
    }

    std::lock_guard lock(mutex_);
    for (const auto& family : families_) {
        if (family->name() == name) {
            throw std::invalid_argument("metric already registered: " + name);
        }
    }

    auto family = std::make_shared<MetricFamily>(name, help, std::move(labelNames), type);
    families_.push_back(family);
    return family;
}

std::shared_ptr<MetricFamily> MetricsRegistry::find(const std::string& name) const {
    std::lock_guard lock(mutex_);
    for (const auto& family : families_) {
        if (family->name() == name) {
            return family;
        }
    }
    return nullptr;
}

std::string MetricsRegistry::serialize() const {
    std::vector<std::shared_ptr<MetricFamily>> families;
    {
        std::lock_guard lock(mutex_);
        families = families_;
    }

    std::string out;
    for (const auto& family : families) {
        family->serialize(out);
    }
    return out;
}

} // namespace trafficpulse::infra

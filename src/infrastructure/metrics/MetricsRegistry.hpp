#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trafficpulse::infra {

/**
 * @brief Exposition type of a metric family.
 */
enum class MetricType {
    Gauge,   ///< Value that may go up and down
    Counter  ///< Monotonic running total
};

/**
 * @brief A labeled metric family.
 *
 * Each distinct set of label values is one series. Setting a series replaces
 * its value; series are never removed, so a value stays visible until it is
 * overwritten. Counter families are set from running totals kept elsewhere.
 */
class MetricFamily {
public:
    /**
     * @brief Constructs a metric family.
     * @param name Metric name (e.g., "network_ip_tx_bps").
     * @param help Help text emitted in the exposition.
     * @param labelNames Ordered label names every series must supply.
     * @param type Type written on the family's TYPE line.
     */
    MetricFamily(std::string name, std::string help, std::vector<std::string> labelNames,
                 MetricType type = MetricType::Gauge);

    MetricFamily(const MetricFamily&) = delete;
    MetricFamily& operator=(const MetricFamily&) = delete;

    /**
     * @brief Sets the value of one series.
     * @param labelValues Label values in the order of the family's label names.
     * @param value New series value.
     * @throws std::invalid_argument if the number of label values does not match.
     */
    void set(const std::vector<std::string>& labelValues, double value);

    /**
     * @brief Returns the value of one series, if it has ever been set.
     */
    std::optional<double> value(const std::vector<std::string>& labelValues) const;

    /**
     * @brief Returns the number of series in the family.
     */
    size_t size() const;

    /**
     * @brief Appends the family in Prometheus text format to @p out.
     *
     * Families without any series produce no output.
     */
    void serialize(std::string& out) const;

    const std::string& name() const { return name_; }
    const std::vector<std::string>& labelNames() const { return labelNames_; }
    MetricType type() const { return type_; }

private:
    std::string name_;
    std::string help_;
    std::vector<std::string> labelNames_;
    MetricType type_;

    mutable std::mutex mutex_;
    std::map<std::vector<std::string>, double> series_;
};

/**
 * @brief Collection of metric families served by the exposition endpoint.
 *
 * Families are serialized in registration order using the Prometheus text
 * exposition format, version 0.0.4.
 */
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /**
     * @brief Registers a new gauge family.
     * @param name Metric name; must match [a-zA-Z_:][a-zA-Z0-9_:]*.
     * @param help Help text.
     * @param labelNames Ordered label names.
     * @return The registered family.
     * @throws std::invalid_argument if the name is invalid or already registered.
     */
    std::shared_ptr<MetricFamily> registerGauge(const std::string& name, const std::string& help,
                                                std::vector<std::string> labelNames = {});

    /**
     * @brief Registers a new counter family.
     *
     * Same rules as registerGauge(); counter names should end in "_total".
     */
    std::shared_ptr<MetricFamily> registerCounter(const std::string& name,
                                                  const std::string& help,
                                                  std::vector<std::string> labelNames = {});

    /**
     * @brief Finds a registered family by name.
     * @return The family, or nullptr if no family has that name.
     */
    std::shared_ptr<MetricFamily> find(const std::string& name) const;

    /**
     * @brief Renders all families in Prometheus text exposition format.
     */
    std::string serialize() const;

    /**
     * @brief Content type of the output of serialize().
     */
    static constexpr const char* kContentType = "text/plain; version=0.0.4; charset=utf-8";

private:
    std::shared_ptr<MetricFamily> registerFamily(const std::string& name, const std::string& help,
                                                 std::vector<std::string> labelNames,
                                                 MetricType type);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<MetricFamily>> families_;
};

} // namespace trafficpulse::infra

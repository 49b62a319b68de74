#pragma once

#include "KafkaConfig.hpp"
#include <librdkafka/rdkafka.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace connector::kafka {

    struct KafkaHandleDeleter {
        void operator()(rd_kafka_t *handle) const { rd_kafka_destroy(handle); }
    };

    using KafkaHandle = std::unique_ptr<rd_kafka_t, KafkaHandleDeleter>;

    /**
     * @brief rd_kafka_conf_t builder. Ownership passes to the handle created by open().
     */
    class KafkaConf {
    public:
        KafkaConf() : conf_(rd_kafka_conf_new()) {
            if (!conf_) {
                throw std::runtime_error("rd_kafka_conf_new returned null");
            }
        }

        ~KafkaConf() {
            if (conf_) rd_kafka_conf_destroy(conf_);
        }

        KafkaConf(const KafkaConf &) = delete;

        KafkaConf &operator=(const KafkaConf &) = delete;

        KafkaConf &set(const std::string &key, const std::string &value) {
            char reason[512] = {0};
            if (rd_kafka_conf_set(conf_, key.c_str(), value.c_str(), reason, sizeof(reason)) != RD_KAFKA_CONF_OK) {
                throw std::runtime_error("Kafka setting " + key + " rejected: " + reason);
            }
            return *this;
        }

        KafkaConf &set(const std::string &key, int value) {
            return set(key, std::to_string(value));
        }

        // Brokers, identity and security; identical for both directions.
        KafkaConf &applyCommon(const KafkaConfig &config) {
            set("bootstrap.servers", config.brokers);
            set("client.id", config.clientId);
            set("socket.timeout.ms", 10000);
            set("socket.keepalive.enable", "true");

            const bool sasl = !config.saslMechanism.empty();
            if (config.usesSsl()) {
                set("security.protocol", sasl ? "sasl_ssl" : "ssl");
                set("ssl.ca.location", config.sslCaLocation);
                if (!config.sslCertLocation.empty()) set("ssl.certificate.location", config.sslCertLocation);
                if (!config.sslKeyLocation.empty()) set("ssl.key.location", config.sslKeyLocation);
            } else if (sasl) {
                set("security.protocol", "sasl_plaintext");
            }
            if (sasl) {
                set("sasl.mechanisms", config.saslMechanism);
                set("sasl.username", config.saslUsername);
                set("sasl.password", config.saslPassword);
            }
            return *this;
        }

        rd_kafka_conf_t *raw() const { return conf_; }

        /// Creates the client handle; on success the handle owns the configuration.
        KafkaHandle open(rd_kafka_type_t type) {
            char reason[512] = {0};
            rd_kafka_t *handle = rd_kafka_new(type, conf_, reason, sizeof(reason));
            if (!handle) {
                throw std::runtime_error(std::string("rd_kafka_new failed: ") + reason);
            }
            conf_ = nullptr;
            return KafkaHandle(handle);
        }

    private:
        rd_kafka_conf_t *conf_;
    };

}

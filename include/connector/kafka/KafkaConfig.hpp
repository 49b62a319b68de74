#pragma once

#include <string>

namespace connector::kafka {
    /**
     * Broker, client and hub identity settings for the remote print connector.
     *
     * String fields start out as "${ENV_NAME:default}" placeholders and are
     * replaced by resolveFromEnvironment(). Numeric tuning values are fixed.
     */
    struct KafkaConfig {
        std::string enabled = "${KAFKA_ENABLED:false}";
        std::string brokers = "${KAFKA_BROKERS:localhost:9092}";
        std::string clientId = "${KAFKA_CLIENT_ID:pos_printer_hub_001}";

        std::string consumerGroupId = "${KAFKA_CONSUMER_GROUP:pos_printer_hub_group}";
        std::string autoOffsetReset = "${KAFKA_AUTO_OFFSET_RESET:latest}";
        int sessionTimeoutMs = 30000;
        int pollTimeoutMs = 1000;
        int autoCommitIntervalMs = 5000;

        std::string compressionType = "${KAFKA_COMPRESSION_TYPE:snappy}";
        int deliveryTimeoutMs = 30000;
        int requestTimeoutMs = 5000;
        int lingerMs = 5;

        std::string sslCaLocation = "${KAFKA_SSL_CA_LOCATION:}";
        std::string sslCertLocation = "${KAFKA_SSL_CERT_LOCATION:}";
        std::string sslKeyLocation = "${KAFKA_SSL_KEY_LOCATION:}";
        std::string saslMechanism = "${KAFKA_SASL_MECHANISM:}";
        std::string saslUsername = "${KAFKA_SASL_USERNAME:}";
        std::string saslPassword = "${KAFKA_SASL_PASSWORD:}";

        std::string hubId = "${HUB_ID:pos_hub_001}";
        std::string location = "${HUB_LOCATION:store_001}";

        /// Reads the optional .env file (existing variables win), then resolves every placeholder.
        void resolveFromEnvironment(const std::string &envFilePath = ".env");

        bool isEnabled() const { return enabled == "true" || enabled == "1"; }

        bool usesSsl() const { return !sslCaLocation.empty(); }

        void printConfig() const;

        /// Replaces each ${NAME:default} in value; unterminated placeholders are left as text.
        static std::string resolvePlaceholder(const std::string &value);

        /// Returns the number of variables exported from the file.
        static int loadEnvFile(const std::string &envFilePath);
    };
}

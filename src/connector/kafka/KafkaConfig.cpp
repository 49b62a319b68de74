#include "connector/kafka/KafkaConfig.hpp"
#include "logger/Logger.hpp"
#include <cstdlib>
#include <fstream>

namespace connector::kafka {
    namespace {
        std::string trimmed(const std::string &text, const char *blanks = " \t\r") {
            auto first = text.find_first_not_of(blanks);
            if (first == std::string::npos) return {};
            return text.substr(first, text.find_last_not_of(blanks) - first + 1);
        }

        std::string unquoted(const std::string &text) {
            if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
                return text.substr(1, text.size() - 2);
            }
            return text;
        }

        using Field = std::string KafkaConfig::*;

        const Field kPlaceholderFields[] = {
            &KafkaConfig::enabled, &KafkaConfig::brokers, &KafkaConfig::clientId,
            &KafkaConfig::consumerGroupId, &KafkaConfig::autoOffsetReset, &KafkaConfig::compressionType,
            &KafkaConfig::sslCaLocation, &KafkaConfig::sslCertLocation, &KafkaConfig::sslKeyLocation,
            &KafkaConfig::saslMechanism, &KafkaConfig::saslUsername, &KafkaConfig::saslPassword,
            &KafkaConfig::hubId, &KafkaConfig::location,
        };
    }

    std::string KafkaConfig::resolvePlaceholder(const std::string &value) {
        std::string out;
        size_t cursor = 0;
        while (cursor < value.size()) {
            auto open = value.find("${", cursor);
            auto close = open == std::string::npos ? std::string::npos : value.find('}', open);
            if (close == std::string::npos) {
                out.append(value, cursor, std::string::npos);
                break;
            }
            out.append(value, cursor, open - cursor);

            std::string body = value.substr(open + 2, close - open - 2);
            auto colon = body.find(':');
            std::string name = body.substr(0, colon);
            std::string fallback = colon == std::string::npos ? "" : body.substr(colon + 1);

            const char *fromEnv = std::getenv(name.c_str());
            out += fromEnv ? fromEnv : fallback;
            cursor = close + 1;
        }
        return out;
    }

    int KafkaConfig::loadEnvFile(const std::string &envFilePath) {
        std::ifstream input(envFilePath);
        if (!input) {
            return 0;
        }

        int exported = 0;
        std::string line;
        while (std::getline(input, line)) {
            line = trimmed(line);
            if (line.empty() || line.front() == '#') continue;
            auto equals = line.find('=');
            if (equals == std::string::npos) continue;

            std::string name = trimmed(line.substr(0, equals));
            if (name.empty() || std::getenv(name.c_str()) != nullptr) continue;

            std::string value = unquoted(trimmed(line.substr(equals + 1)));
            if (setenv(name.c_str(), value.c_str(), 0) == 0) {
                ++exported;
            }
        }
        Logger::logInfo("[KafkaConfig] " + std::to_string(exported) + " variable(s) taken from " + envFilePath);
        return exported;
    }

    void KafkaConfig::resolveFromEnvironment(const std::string &envFilePath) {
        loadEnvFile(envFilePath);
        for (Field field: kPlaceholderFields) {
            this->*field = resolvePlaceholder(this->*field);
        }
    }

    void KafkaConfig::printConfig() const {
        if (!isEnabled()) {
            Logger::logInfo("[KafkaConfig] Remote printing disabled (KAFKA_ENABLED)");
            return;
        }
        Logger::logInfo("[KafkaConfig] brokers=" + brokers + " client=" + clientId + " group=" + consumerGroupId);
        Logger::logInfo("[KafkaConfig] hub=" + hubId + " location=" + location +
                        " ssl=" + (usesSsl() ? "on" : "off") +
                        (saslMechanism.empty() ? "" : " sasl=" + saslMechanism));
    }
}

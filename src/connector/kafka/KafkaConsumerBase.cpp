#include "connector/kafka/KafkaConsumerBase.hpp"
#include "logger/Logger.hpp"

namespace connector::kafka {
    namespace {
        void logClientError(rd_kafka_t *client, int code, const char *reason, void *) {
            Logger::logError("[Kafka " + std::string(rd_kafka_name(client)) + "] " +
                             rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(code)) + ": " + reason);
        }

        std::string bytes(const void *data, size_t size) {
            return data ? std::string(static_cast<const char *>(data), size) : std::string();
        }
    }

    KafkaConsumerBase::KafkaConsumerBase(const KafkaConfig &config, std::string topicName)
            : config_(config), topic_(std::move(topicName)), tag_("[Consumer " + topic_ + "]") {
    }

    KafkaConsumerBase::~KafkaConsumerBase() {
        KafkaConsumerBase::stopReceiving();
    }

    void KafkaConsumerBase::startReceiving() {
        if (receiving_) {
            return;
        }
        tag_ = "[" + getReceiverName() + "]";

        try {
            subscribe();
        } catch (const std::exception &e) {
            handle_.reset();
            Logger::logError(tag_ + " Cannot subscribe to " + topic_ + ": " + e.what());
            throw;
        }

        receiving_ = true;
        poller_ = std::thread(&KafkaConsumerBase::pollLoop, this);
        Logger::logInfo(tag_ + " Listening on " + topic_);
    }

    void KafkaConsumerBase::stopReceiving() {
        if (!receiving_.exchange(false)) {
            return;
        }
        if (poller_.joinable()) {
            poller_.join();
        }

        rd_kafka_resp_err_t closed = rd_kafka_consumer_close(handle_.get());
        if (closed != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logWarning(tag_ + " Close reported " + rd_kafka_err2str(closed));
        }
        handle_.reset();
        Logger::logInfo(tag_ + " Stopped");
    }

    void KafkaConsumerBase::subscribe() {
        KafkaConf conf;
        conf.applyCommon(config_)
                .set("group.id", config_.consumerGroupId)
                .set("session.timeout.ms", config_.sessionTimeoutMs)
                .set("enable.auto.commit", "true")
                .set("auto.commit.interval.ms", config_.autoCommitIntervalMs)
                .set("auto.offset.reset", config_.autoOffsetReset);
        rd_kafka_conf_set_error_cb(conf.raw(), logClientError);

        handle_ = conf.open(RD_KAFKA_CONSUMER);
        rd_kafka_poll_set_consumer(handle_.get());

        rd_kafka_topic_partition_list_t *topics = rd_kafka_topic_partition_list_new(1);
        rd_kafka_topic_partition_list_add(topics, topic_.c_str(), RD_KAFKA_PARTITION_UA);
        rd_kafka_resp_err_t status = rd_kafka_subscribe(handle_.get(), topics);
        rd_kafka_topic_partition_list_destroy(topics);

        if (status != RD_KAFKA_RESP_ERR_NO_ERROR) {
            throw std::runtime_error(rd_kafka_err2str(status));
        }
    }

    void KafkaConsumerBase::pollLoop() {
        while (receiving_) {
            rd_kafka_message_t *record = rd_kafka_consumer_poll(handle_.get(), config_.pollTimeoutMs);
            if (!record) {
                continue;
            }
            if (record->err == RD_KAFKA_RESP_ERR_NO_ERROR) {
                deliver(*record);
            } else if (record->err != RD_KAFKA_RESP_ERR__PARTITION_EOF) {
                Logger::logError(tag_ + " Poll failed: " + rd_kafka_message_errstr(record));
            }
            rd_kafka_message_destroy(record);
        }
    }

    void KafkaConsumerBase::deliver(const rd_kafka_message_t &record) {
        if (!handler_) {
            return;
        }
        try {
            handler_(bytes(record.payload, record.len), bytes(record.key, record.key_len));
        } catch (const std::exception &e) {
            Logger::logError(tag_ + " Handler failed: " + e.what());
        }
    }

}

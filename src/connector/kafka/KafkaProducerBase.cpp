#include "connector/kafka/KafkaProducerBase.hpp"
#include "logger/Logger.hpp"

namespace connector::kafka {
    namespace {
        constexpr int kFlushTimeoutMs = 5000;

        void onDelivery(rd_kafka_t *client, const rd_kafka_message_t *record, void *) {
            if (record->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                Logger::logError("[Kafka " + std::string(rd_kafka_name(client)) + "] Delivery to " +
                                 rd_kafka_topic_name(record->rkt) + " failed: " + rd_kafka_err2str(record->err));
            }
        }

        void onClientError(rd_kafka_t *client, int code, const char *reason, void *) {
            Logger::logError("[Kafka " + std::string(rd_kafka_name(client)) + "] " +
                             rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(code)) + ": " + reason);
        }
    }

    KafkaProducerBase::KafkaProducerBase(const KafkaConfig &config, std::string topicName)
            : topic_(std::move(topicName)) {
        try {
            KafkaConf conf;
            conf.applyCommon(config)
                    .set("delivery.timeout.ms", config.deliveryTimeoutMs)
                    .set("request.timeout.ms", config.requestTimeoutMs)
                    .set("compression.type", config.compressionType)
                    .set("linger.ms", config.lingerMs);
            rd_kafka_conf_set_dr_msg_cb(conf.raw(), onDelivery);
            rd_kafka_conf_set_error_cb(conf.raw(), onClientError);
            handle_ = conf.open(RD_KAFKA_PRODUCER);
        } catch (const std::exception &e) {
            Logger::logError("[Producer " + topic_ + "] Unavailable: " + e.what());
        }
    }

    KafkaProducerBase::~KafkaProducerBase() {
        if (!handle_) {
            return;
        }
        rd_kafka_resp_err_t flushed = rd_kafka_flush(handle_.get(), kFlushTimeoutMs);
        if (flushed != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logWarning("[Producer " + topic_ + "] Pending messages dropped: " + rd_kafka_err2str(flushed));
        }
    }

    bool KafkaProducerBase::sendMessage(const std::string &message, const std::string &key) {
        if (!handle_) {
            Logger::logError("[" + getSenderName() + "] Not connected, message for " + topic_ + " dropped");
            return false;
        }

        rd_kafka_resp_err_t queued = rd_kafka_producev(
                handle_.get(),
                RD_KAFKA_V_TOPIC(topic_.c_str()),
                RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
                RD_KAFKA_V_VALUE(const_cast<char *>(message.data()), message.size()),
                RD_KAFKA_V_KEY(key.empty() ? nullptr : key.data(), key.size()),
                RD_KAFKA_V_END);
        rd_kafka_poll(handle_.get(), 0);

        if (queued != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[" + getSenderName() + "] Enqueue on " + topic_ + " failed: " +
                             rd_kafka_err2str(queued));
            return false;
        }
        return true;
    }

}

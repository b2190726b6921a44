#include "group_consumer.hpp"
#include "rdkafka_admin.hpp"
#include <chrono>
#include <iostream>
#include <tuple>

KafkaGroupConsumer::KafkaGroupConsumer(const AdminConfig& config, const std::string& group_id)
    : config_(config),
      group_id_(group_id),
      from_beginning_(false),
      running_(false),
      fetched_(fetched_promise_.get_future().share()),
      fetched_signalled_(false) {
}

KafkaGroupConsumer::~KafkaGroupConsumer() {
    stop();
}

void KafkaGroupConsumer::subscribe(const std::string& topic, bool from_beginning) {
    topic_ = topic;
    from_beginning_ = from_beginning;

    try {
        cppkafka::Configuration configuration = {
            {"metadata.broker.list", config_.brokers},
            {"group.id", group_id_},
            {"client.id", config_.client_id},
            {"enable.auto.commit", "false"},
            {"auto.offset.reset", from_beginning ? "earliest" : "latest"},
            {"enable.partition.eof", "false"},
        };
        consumer_ = std::make_unique<cppkafka::Consumer>(configuration);
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to create consumer for group " + group_id_);
    } catch (const cppkafka::Exception& e) {
        throw AdminError("Failed to create consumer for group " + group_id_ + ": " + e.what());
    }
}

GroupDescription KafkaGroupConsumer::describeGroup() {
    if (!consumer_) {
        throw AdminError("Consumer for group " + group_id_ + " is not subscribed");
    }

    GroupDescription description;
    description.group_id = group_id_;
    try {
        cppkafka::GroupInformation info = consumer_->get_consumer_group(group_id_);
        description.state = info.get_state();
        description.protocol_type = info.get_protocol_type();
        description.protocol = info.get_protocol();
        for (const auto& member : info.get_members()) {
            description.members.push_back({member.get_member_id(), member.get_client_id(),
                                           member.get_client_host()});
        }
    } catch (const cppkafka::ElementNotFound&) {
        description.state = "Dead";
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to describe group " + group_id_);
    }
    return description;
}

void KafkaGroupConsumer::pause(const std::vector<std::string>& topics) {
    paused_topics_.insert(topics.begin(), topics.end());
}

void KafkaGroupConsumer::seek(const SeekTarget& target) {
    seek_targets_[{target.topic, target.partition}] = target.offset;
}

int64_t KafkaGroupConsumer::resolveOffset(const std::string& topic, int32_t partition, int64_t offset) {
    if (offset != SeekTarget::EARLIEST && offset != SeekTarget::LATEST) {
        return offset;
    }
    try {
        auto watermarks = consumer_->query_offsets(cppkafka::TopicPartition(topic, partition));
        return offset == SeekTarget::EARLIEST ? std::get<0>(watermarks) : std::get<1>(watermarks);
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(),
                            "Failed to query offsets of " + topic + "/" + std::to_string(partition));
    }
}

void KafkaGroupConsumer::run(BatchHandler each_batch) {
    if (!consumer_) {
        throw AdminError("Consumer for group " + group_id_ + " is not subscribed");
    }
    if (running_) {
        throw AdminError("Consumer for group " + group_id_ + " is already running");
    }

    // Paused before the assignment takes effect, so no poll fetches from it
    consumer_->set_assignment_callback([this](cppkafka::TopicPartitionList& partitions) {
        for (auto& tp : partitions) {
            auto target = seek_targets_.find({tp.get_topic(), tp.get_partition()});
            if (target != seek_targets_.end()) {
                tp.set_offset(resolveOffset(tp.get_topic(), tp.get_partition(), target->second));
            }
        }
        cppkafka::TopicPartitionList paused = pausedPartitions(partitions);
        if (!paused.empty()) {
            consumer_->pause_partitions(paused);
        }
    });

    try {
        consumer_->subscribe({topic_});
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to subscribe group " + group_id_ + " to " + topic_);
    }

    running_ = true;
    poll_thread_ = std::thread(&KafkaGroupConsumer::pollLoop, this, std::move(each_batch));
    std::cout << "KafkaGroupConsumer running for group " << group_id_ << " on topic " << topic_ << std::endl;
}

cppkafka::TopicPartitionList KafkaGroupConsumer::pausedPartitions(
    const cppkafka::TopicPartitionList& assignment) const {
    cppkafka::TopicPartitionList paused;
    for (const auto& tp : assignment) {
        if (paused_topics_.count(tp.get_topic())) {
            paused.emplace_back(tp.get_topic(), tp.get_partition());
        }
    }
    return paused;
}

void KafkaGroupConsumer::completeFirstFetch(const cppkafka::TopicPartitionList& assignment) {
    cppkafka::TopicPartitionList commits;
    for (const auto& tp : assignment) {
        auto target = seek_targets_.find({tp.get_topic(), tp.get_partition()});
        if (target != seek_targets_.end()) {
            commits.emplace_back(tp.get_topic(), tp.get_partition(),
                                 resolveOffset(tp.get_topic(), tp.get_partition(), target->second));
        }
    }

    if (!commits.empty()) {
        consumer_->commit(commits);
    }

    fetched_signalled_ = true;
    fetched_promise_.set_value();
    std::cout << "Committed " << commits.size() << " offsets for group " << group_id_ << std::endl;
}

void KafkaGroupConsumer::pollLoop(BatchHandler each_batch) {
    try {
        while (running_) {
            cppkafka::Message msg = consumer_->poll(std::chrono::milliseconds(100));

            if (msg && !msg.get_error() && each_batch) {
                ConsumerBatch batch;
                batch.topic = msg.get_topic();
                batch.partition = msg.get_partition();
                batch.message_count = 1;
                each_batch(batch);
            } else if (msg && msg.get_error() && !msg.is_eof()) {
                std::cerr << "Consumer error in group " << group_id_ << ": " << msg.get_error() << std::endl;
            }

            if (!fetched_signalled_) {
                cppkafka::TopicPartitionList assignment = consumer_->get_assignment();
                if (!assignment.empty()) {
                    completeFirstFetch(assignment);
                }
            }
        }
    } catch (const cppkafka::HandleException& e) {
        if (!fetched_signalled_) {
            fetched_signalled_ = true;
            fetched_promise_.set_exception(std::make_exception_ptr(
                protocolError(e.get_error().get_error(), "Consumer for group " + group_id_ + " failed")));
        }
        std::cerr << "Kafka error in consumer for group " << group_id_ << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        if (!fetched_signalled_) {
            fetched_signalled_ = true;
            fetched_promise_.set_exception(std::current_exception());
        }
        std::cerr << "Unexpected error in consumer for group " << group_id_ << ": " << e.what() << std::endl;
    }

    if (!fetched_signalled_) {
        fetched_signalled_ = true;
        fetched_promise_.set_exception(std::make_exception_ptr(
            AdminError("Consumer for group " + group_id_ + " stopped before fetching")));
    }
}

std::shared_future<void> KafkaGroupConsumer::fetchCompleted() {
    return fetched_;
}

void KafkaGroupConsumer::stop() {
    running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    if (consumer_) {
        try {
            consumer_->unsubscribe();
        } catch (const std::exception& e) {
            std::cerr << "Error during consumer shutdown for group " << group_id_ << ": " << e.what() << std::endl;
        }
        consumer_.reset();
    }
}

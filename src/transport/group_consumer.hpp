#ifndef GROUP_CONSUMER_HPP
#define GROUP_CONSUMER_HPP

#include "../config.hpp"
#include "../admin/cluster.hpp"
#include <cppkafka/cppkafka.h>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Short-lived consumer group member. Joins the group, pauses and seeks its
// assignment as it is received, commits the seek targets, then leaves on stop().
class KafkaGroupConsumer : public GroupConsumer {
public:
    KafkaGroupConsumer(const AdminConfig& config, const std::string& group_id);
    ~KafkaGroupConsumer() override;

    void subscribe(const std::string& topic, bool from_beginning) override;

    // State of the group as reported by its coordinator; "Dead" if unknown
    GroupDescription describeGroup() override;

    void pause(const std::vector<std::string>& topics) override;

    void seek(const SeekTarget& target) override;

    void run(BatchHandler each_batch) override;

    std::shared_future<void> fetchCompleted() override;

    void stop() override;

private:
    AdminConfig config_;
    std::string group_id_;
    std::string topic_;
    bool from_beginning_;

    std::unique_ptr<cppkafka::Consumer> consumer_;
    std::set<std::string> paused_topics_;
    std::map<std::pair<std::string, int32_t>, int64_t> seek_targets_;

    std::atomic<bool> running_;
    std::thread poll_thread_;
    std::promise<void> fetched_promise_;
    std::shared_future<void> fetched_;
    bool fetched_signalled_;

    // Replace EARLIEST/LATEST with the partition's current watermark
    int64_t resolveOffset(const std::string& topic, int32_t partition, int64_t offset);

    void pollLoop(BatchHandler each_batch);

    // Partitions of the assignment whose topic was passed to pause()
    cppkafka::TopicPartitionList pausedPartitions(const cppkafka::TopicPartitionList& assignment) const;

    // Commit the seek targets and signal fetchCompleted()
    void completeFirstFetch(const cppkafka::TopicPartitionList& assignment);
};

#endif // GROUP_CONSUMER_HPP

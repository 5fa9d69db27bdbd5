#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/errors.hpp"
#include "chunkdrive/server/event_dispatcher.hpp"
#include "chunkdrive/server/progress_tracker.hpp"
#include "chunkdrive/server/session_index.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/transfer_session.hpp"
#include "chunkdrive/server/upload_engine.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;

namespace
{

    std::filesystem::path make_temp_root(const std::string &name)
    {
        auto root = std::filesystem::temp_directory_path() / ("chunkdrive_" + name);
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root);
        return root;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> make_payload(std::size_t size, unsigned seed)
    {
        std::vector<std::byte> payload(size);
        std::mt19937 rng(seed);
        for (auto &value : payload)
        {
            value = static_cast<std::byte>(rng() & 0xFF);
        }
        return payload;
    }

    std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c)
                       { return static_cast<std::byte>(c); });
        return bytes;
    }

    std::span<const std::byte> chunk_of(const std::vector<std::byte> &payload, std::uint64_t chunk_id,
                                        std::uint64_t chunk_size)
    {
        const auto start = static_cast<std::size_t>(chunk_id * chunk_size);
        const auto length = std::min<std::size_t>(static_cast<std::size_t>(chunk_size), payload.size() - start);
        return std::span<const std::byte>(payload).subspan(start, length);
    }

    template <typename Error, typename Fn>
    bool throws(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const Error &)
        {
            return true;
        }
        return false;
    }

    EngineConfig make_config(const std::filesystem::path &root, EngineConfig base = {})
    {
        base.staging_dir = root / "staging";
        base.upload_dir = root / "uploads";
        return base;
    }

    // Holds the first write after arm() until open_gate(), with the bytes already on disk.
    class GatedChunkStore : public ChunkStore
    {
    public:
        using ChunkStore::ChunkStore;

        void write_at(const std::string &session_id, std::uint64_t offset, std::span<const std::byte> data) override
        {
            ChunkStore::write_at(session_id, offset, data);
            if (armed_.exchange(false))
            {
                written_.set_value();
                released_.wait();
            }
        }

        void arm() { armed_ = true; }
        void wait_until_written() { written_future_.wait(); }
        void open_gate() { release_.set_value(); }

    private:
        std::atomic<bool> armed_{false};
        std::promise<void> written_;
        std::future<void> written_future_{written_.get_future()};
        std::promise<void> release_;
        std::shared_future<void> released_{release_.get_future().share()};
    };

    template <typename Store>
    struct BasicHarness
    {
        explicit BasicHarness(const std::string &name, EngineConfig base = {})
            : root(make_temp_root(name)),
              config(make_config(root, std::move(base))),
              store(config.staging_dir, config.upload_dir),
              tracker(dispatcher),
              engine(config, store, registry, tracker)
        {
        }

        ~BasicHarness()
        {
            dispatcher.stop();
            cleanup_path(root);
        }

        std::filesystem::path root;
        EngineConfig config;
        EventDispatcher dispatcher;
        Store store;
        SessionRegistry registry;
        ProgressTracker tracker;
        ChunkedUploadEngine engine;
    };

    using EngineHarness = BasicHarness<ChunkStore>;

    constexpr std::uint64_t kTotalSize = 13000;
    constexpr std::uint64_t kChunkSize = 1024;

    void test_chunk_plan()
    {
        assert(count_chunks(13000, 1024) == 13);
        assert(count_chunks(2048, 1024) == 2);
        assert(count_chunks(2049, 1024) == 3);
        assert(count_chunks(0, 1024) == 0);
        assert(count_chunks(1, 1024) == 1);

        const auto chunks = plan_chunks(kTotalSize, kChunkSize);
        assert(chunks.size() == 13);
        std::uint64_t sum = 0;
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            assert(chunks[i].chunk_id == i);
            assert(chunks[i].start_offset == i * kChunkSize);
            assert(chunks[i].status == ChunkStatus::Pending);
            assert(chunks[i].retry_count == 0);
            sum += chunks[i].size();
        }
        assert(sum == kTotalSize);
        assert(chunks.back().size() == 520);
        assert(chunks.back().end_offset == kTotalSize);
        assert(plan_chunks(0, kChunkSize).empty());

        // Offsets near the top of the range must not wrap.
        constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
        const auto huge = plan_chunks(kMax, (kMax / 2) + 1);
        assert(huge.size() == 2);
        assert(huge[0].end_offset == huge[1].start_offset);
        assert(huge[1].end_offset == kMax);
        assert(huge[0].size() + huge[1].size() == kMax);
    }

    void test_chunk_store_positioned_writes()
    {
        const auto root = make_temp_root("store");
        {
            ChunkStore store(root / "staging", root / "uploads");
            assert(std::filesystem::exists(root / "staging"));
            assert(std::filesystem::exists(root / "uploads"));

            store.allocate("abc123", 10);
            assert(store.contains("abc123"));
            assert(std::filesystem::file_size(store.staging_path("abc123")) == 10);
            assert(throws<AllocationError>([&]
                                           { store.allocate("abc123", 10); }));

            const std::string tail = "fghij";
            const std::string head = "abcde";
            store.write_at("abc123", 5, std::as_bytes(std::span(tail.data(), tail.size())));
            store.write_at("abc123", 0, std::as_bytes(std::span(head.data(), head.size())));
            assert(throws<ChunkIoError>([&]
                                        { store.write_at("abc123", 8, std::as_bytes(std::span(tail.data(), tail.size()))); }));

            const auto destination = store.destination_path("file", "letters.txt");
            assert(destination == root / "uploads" / "file_letters.txt");
            const auto merged = store.merge("abc123", destination);
            assert(merged == destination);
            assert(!store.contains("abc123"));
            assert(!std::filesystem::exists(store.staging_path("abc123")));

            std::ifstream in(destination, std::ios::binary);
            std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            assert(content == "abcdefghij");

            assert(throws<InvalidArgumentError>([&]
                                                { (void)store.destination_path("file", "../escape.txt"); }));
            assert(throws<InvalidArgumentError>([&]
                                                { (void)store.destination_path("file", "dir/name.txt"); }));
            assert(throws<InvalidArgumentError>([&]
                                                { (void)store.destination_path("", "name.txt"); }));
            assert(throws<InvalidArgumentError>([&]
                                                { (void)store.destination_path("file", ".."); }));

            assert(!store.release("unknown"));
            assert(throws<ChunkIoError>([&]
                                        { store.write_at("unknown", 0, std::as_bytes(std::span(head.data(), head.size()))); }));

            // Requests beyond the free space of the staging filesystem are refused up front.
            assert(throws<AllocationError>([&]
                                           { store.allocate("huge", 1ULL << 62); }));
            assert(!store.contains("huge"));
            assert(!std::filesystem::exists(store.staging_path("huge")));
        }
        cleanup_path(root);
    }

    void test_session_registry()
    {
        SessionRegistry registry;
        auto session = std::make_shared<TransferSession>("s1", "f1", "a.bin", 10, 4, std::nullopt);
        assert(session->total_chunks == 3);
        assert(session->chunks.size() == 3);
        assert(registry.insert(session));
        assert(!registry.insert(std::make_shared<TransferSession>("s1", "f2", "b.bin", 10, 4, std::nullopt)));
        assert(registry.find("s1") == session);
        assert(registry.find("s2") == nullptr);
        assert(registry.size() == 1);
        assert(registry.snapshot().size() == 1);
        assert(registry.remove("s1") == session);
        assert(registry.remove("s1") == nullptr);
        assert(registry.size() == 0);

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t)
        {
            threads.emplace_back([&registry, t]
                                 {
                for (int i = 0; i < 100; ++i) {
                    const auto id = "s" + std::to_string(t) + "_" + std::to_string(i);
                    registry.insert(std::make_shared<TransferSession>(id, "f", "a.bin", 1, 1, std::nullopt));
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(registry.size() == 800);
    }

    void test_out_of_order_upload_completes()
    {
        EngineHarness harness("shuffled");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 7);
        const auto checksum = crypto::hash_bytes(payload);

        const auto session_id = engine.create_session("file42", "report.pdf", kTotalSize, kChunkSize, checksum);
        assert(session_id.size() == 32);
        assert(harness.store.contains(session_id));
        assert(engine.list_sessions() == std::vector<std::string>{session_id});

        auto progress = engine.get_upload_progress(session_id);
        assert(progress.total_chunks == 13);
        assert(progress.uploaded_chunks == 0);
        assert(progress.missing_chunks.size() == 13);

        std::vector<std::uint64_t> order(13);
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), std::mt19937(42));
        for (const auto chunk_id : order)
        {
            const auto ack = engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
            assert(ack.ok);
            assert(!ack.duplicate);
        }

        // An older upload under the same name is replaced.
        {
            std::ofstream stale(harness.config.upload_dir / "file42_report.pdf", std::ios::binary);
            stale << "stale";
        }

        progress = engine.get_upload_progress(session_id);
        assert(progress.uploaded_chunks == 13);
        assert(progress.uploaded_bytes == kTotalSize);
        assert(progress.progress_percent == 100.0);
        assert(progress.missing_chunks.empty());

        const auto result = engine.complete_upload(session_id);
        assert(result.ok);
        assert(result.checksum == checksum);
        assert(result.final_path == harness.config.upload_dir / "file42_report.pdf");
        assert(read_file(result.final_path) == payload);
        assert(!std::filesystem::exists(harness.store.staging_path(session_id)));
        assert(harness.registry.size() == 0);
        assert(throws<SessionNotFoundError>([&]
                                            { (void)engine.get_upload_progress(session_id); }));

        const auto snapshot = harness.tracker.snapshot(session_id);
        assert(snapshot.has_value());
        assert(snapshot->status == TransferStatus::Completed);
        assert(snapshot->progress_percent == 100.0);
    }

    void test_reverse_order_matches_forward_order()
    {
        EngineHarness harness("reverse");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 11);

        const auto forward = engine.create_session("fwd", "data.bin", kTotalSize, kChunkSize);
        const auto reverse = engine.create_session("rev", "data.bin", kTotalSize, kChunkSize);
        assert(forward != reverse);
        for (std::uint64_t i = 0; i < 13; ++i)
        {
            engine.upload_chunk(forward, i, chunk_of(payload, i, kChunkSize));
            const auto back = 12 - i;
            engine.upload_chunk(reverse, back, chunk_of(payload, back, kChunkSize));
        }
        const auto first = engine.complete_upload(forward);
        const auto second = engine.complete_upload(reverse);
        assert(first.checksum == second.checksum);
        assert(read_file(first.final_path) == read_file(second.final_path));
        assert(read_file(first.final_path) == payload);
    }

    void test_duplicate_chunk_is_idempotent()
    {
        EngineHarness harness("duplicate");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 3);
        const auto session_id = engine.create_session("dup", "data.bin", kTotalSize, kChunkSize);

        auto ack = engine.upload_chunk(session_id, 3, chunk_of(payload, 3, kChunkSize));
        assert(ack.ok && !ack.duplicate);
        const auto before = engine.chunk_table(session_id);

        // A resend with different content must not overwrite the stored range.
        const auto other = make_payload(kChunkSize, 99);
        ack = engine.upload_chunk(session_id, 3, other);
        assert(ack.ok && ack.duplicate);

        const auto after = engine.chunk_table(session_id);
        assert(after[3].status == ChunkStatus::Completed);
        assert(after[3].checksum == before[3].checksum);
        assert(after[3].checksum == crypto::hash_bytes(chunk_of(payload, 3, kChunkSize)));
        assert(after[3].retry_count == before[3].retry_count);

        const auto progress = engine.get_upload_progress(session_id);
        assert(progress.uploaded_chunks == 1);
        assert(progress.uploaded_bytes == kChunkSize);
    }

    void test_resume_returns_complement()
    {
        EngineHarness harness("resume");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 5);
        const auto session_id = engine.create_session("res", "data.bin", kTotalSize, kChunkSize);

        for (const std::uint64_t chunk_id : {0ULL, 2ULL, 5ULL, 7ULL, 12ULL})
        {
            engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
        }
        const std::vector<std::uint64_t> expected{1, 3, 4, 6, 8, 9, 10, 11};
        assert(engine.resume_upload(session_id) == expected);

        // Resume does not modify the session.
        assert(engine.resume_upload(session_id) == expected);
        assert(engine.get_upload_progress(session_id).uploaded_chunks == 5);

        assert(throws<SessionNotFoundError>([&]
                                            { (void)engine.resume_upload("deadbeef"); }));
    }

    void test_incomplete_completion_reports_missing()
    {
        EngineHarness harness("incomplete");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 6);
        const auto session_id = engine.create_session("inc", "data.bin", kTotalSize, kChunkSize);
        for (std::uint64_t chunk_id = 0; chunk_id < 13; ++chunk_id)
        {
            if (chunk_id != 4 && chunk_id != 9)
            {
                engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
            }
        }

        bool caught = false;
        try
        {
            (void)engine.complete_upload(session_id);
        }
        catch (const IncompleteTransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::IncompleteTransfer);
            assert((ex.missing_chunks() == std::vector<std::uint64_t>{4, 9}));
        }
        assert(caught);
        assert(harness.registry.size() == 1);
        assert(std::filesystem::exists(harness.store.staging_path(session_id)));

        engine.upload_chunk(session_id, 4, chunk_of(payload, 4, kChunkSize));
        engine.upload_chunk(session_id, 9, chunk_of(payload, 9, kChunkSize));
        assert(engine.complete_upload(session_id).ok);
    }

    void test_cancel_mid_upload()
    {
        EngineHarness harness("cancel");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 8);
        const auto session_id = engine.create_session("can", "data.bin", kTotalSize, kChunkSize);
        for (std::uint64_t chunk_id = 0; chunk_id < 5; ++chunk_id)
        {
            engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
        }

        const auto staging = harness.store.staging_path(session_id);
        assert(std::filesystem::exists(staging));
        assert(engine.cancel_upload(session_id));
        assert(!std::filesystem::exists(staging));
        assert(throws<SessionNotFoundError>([&]
                                            { (void)engine.get_upload_progress(session_id); }));
        assert(throws<SessionNotFoundError>([&]
                                            { engine.upload_chunk(session_id, 5, chunk_of(payload, 5, kChunkSize)); }));
        assert(harness.tracker.snapshot(session_id)->status == TransferStatus::Cancelled);

        // Cancelling again, or cancelling something unknown, still succeeds.
        assert(engine.cancel_upload(session_id));
        assert(engine.cancel_upload("0123abcd"));
        assert(engine.cancel_upload("../not-an-id"));
        assert(std::filesystem::is_empty(harness.config.upload_dir));
    }

    void test_rejected_chunks_leave_state_unchanged()
    {
        EngineHarness harness("rejects");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 9);
        const auto session_id = engine.create_session("rej", "data.bin", kTotalSize, kChunkSize);

        // The last chunk is 520 bytes; a full-size payload is refused.
        bool caught = false;
        try
        {
            engine.upload_chunk(session_id, 12, chunk_of(payload, 0, kChunkSize));
        }
        catch (const SizeMismatchError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::SizeMismatch);
        }
        assert(caught);
        auto table = engine.chunk_table(session_id);
        assert(table[12].status == ChunkStatus::Pending);
        assert(table[12].retry_count == 0);

        engine.upload_chunk(session_id, 0, chunk_of(payload, 0, kChunkSize));
        assert(throws<SizeMismatchError>([&]
                                         { engine.upload_chunk(session_id, 0, chunk_of(payload, 12, kChunkSize)); }));
        table = engine.chunk_table(session_id);
        assert(table[0].status == ChunkStatus::Completed);

        assert(throws<InvalidChunkError>([&]
                                         { engine.upload_chunk(session_id, 13, chunk_of(payload, 12, kChunkSize)); }));
        assert(throws<SessionNotFoundError>([&]
                                            { engine.upload_chunk("feedface", 0, chunk_of(payload, 0, kChunkSize)); }));

        const auto progress = engine.get_upload_progress(session_id);
        assert(progress.uploaded_chunks == 1);
        assert(progress.uploaded_bytes == kChunkSize);
    }

    void test_integrity_mismatch_keeps_staging()
    {
        EngineHarness harness("integrity");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 10);
        const std::string wrong(64, '0');
        const auto session_id = engine.create_session("int", "data.bin", kTotalSize, kChunkSize, wrong);
        for (std::uint64_t chunk_id = 0; chunk_id < 13; ++chunk_id)
        {
            engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
        }

        bool caught = false;
        try
        {
            (void)engine.complete_upload(session_id);
        }
        catch (const IntegrityError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::IntegrityMismatch);
            assert(ex.expected() == wrong);
            assert(ex.computed() == crypto::hash_bytes(payload));
        }
        assert(caught);
        assert(std::filesystem::exists(harness.store.staging_path(session_id)));
        assert(harness.registry.size() == 1);
        assert(!std::filesystem::exists(harness.config.upload_dir / "int_data.bin"));

        const auto snapshot = harness.tracker.snapshot(session_id);
        assert(snapshot->status == TransferStatus::InProgress);
        assert(snapshot->error_count == 1);

        const auto result = engine.force_complete(session_id);
        assert(result.ok);
        assert(read_file(result.final_path) == payload);
        assert(harness.registry.size() == 0);
    }

    void test_write_failure_marks_chunk_failed()
    {
        EngineHarness harness("iofail");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 12);
        const auto session_id = engine.create_session("io", "data.bin", kTotalSize, kChunkSize);

        // Losing the staging file makes every write fail.
        assert(harness.store.release(session_id));
        assert(throws<ChunkIoError>([&]
                                    { engine.upload_chunk(session_id, 0, chunk_of(payload, 0, kChunkSize)); }));
        auto table = engine.chunk_table(session_id);
        assert(table[0].status == ChunkStatus::Failed);
        assert(table[0].retry_count == 1);
        assert(engine.resume_upload(session_id).front() == 0);

        harness.store.allocate(session_id, kTotalSize);
        const auto ack = engine.upload_chunk(session_id, 0, chunk_of(payload, 0, kChunkSize));
        assert(ack.ok && !ack.duplicate);
        table = engine.chunk_table(session_id);
        assert(table[0].status == ChunkStatus::Completed);
        assert(table[0].retry_count == 1);

        const auto snapshot = harness.tracker.snapshot(session_id);
        assert(snapshot->error_count == 1);
        assert(snapshot->retry_count == 1);
    }

    void test_failed_merge_can_be_retried()
    {
        EngineHarness harness("remerge");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 16);
        const auto session_id = engine.create_session("mrg", "data.bin", kTotalSize, kChunkSize);
        for (std::uint64_t chunk_id = 0; chunk_id < 13; ++chunk_id)
        {
            engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
        }

        // A directory in the way makes the rename fail.
        const auto destination = harness.config.upload_dir / "mrg_data.bin";
        std::filesystem::create_directories(destination / "blocker");
        assert(throws<ChunkIoError>([&]
                                    { (void)engine.complete_upload(session_id); }));
        assert(harness.registry.size() == 1);
        assert(harness.store.contains(session_id));
        assert(std::filesystem::exists(harness.store.staging_path(session_id)));
        assert(engine.upload_chunk(session_id, 2, chunk_of(payload, 2, kChunkSize)).duplicate);
        assert(harness.tracker.snapshot(session_id)->status == TransferStatus::InProgress);

        std::filesystem::remove_all(destination);
        const auto result = engine.complete_upload(session_id);
        assert(result.ok);
        assert(read_file(result.final_path) == payload);
        assert(!std::filesystem::exists(harness.store.staging_path(session_id)));
        assert(harness.registry.size() == 0);
    }

    void test_same_chunk_in_flight_is_busy()
    {
        BasicHarness<GatedChunkStore> harness("busy");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 17);
        const auto session_id = engine.create_session("bsy", "data.bin", kTotalSize, kChunkSize);

        harness.store.arm();
        ChunkAck first;
        std::thread writer([&]
                           { first = engine.upload_chunk(session_id, 3, chunk_of(payload, 3, kChunkSize)); });
        harness.store.wait_until_written();

        bool caught = false;
        try
        {
            engine.upload_chunk(session_id, 3, chunk_of(payload, 3, kChunkSize));
        }
        catch (const ChunkBusyError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::Busy);
        }
        assert(caught);
        assert(engine.chunk_table(session_id)[3].status == ChunkStatus::Uploading);
        assert(engine.upload_chunk(session_id, 4, chunk_of(payload, 4, kChunkSize)).ok);

        harness.store.open_gate();
        writer.join();
        assert(first.ok && !first.duplicate);
        assert(engine.upload_chunk(session_id, 3, chunk_of(payload, 3, kChunkSize)).duplicate);
        assert(engine.get_upload_progress(session_id).uploaded_chunks == 2);
    }

    void test_write_racing_cancel_is_discarded()
    {
        EngineConfig base;
        base.persist_index = true;
        BasicHarness<GatedChunkStore> harness("discard", base);
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 18);
        const auto session_id = engine.create_session("dsc", "data.bin", kTotalSize, kChunkSize);
        const auto sidecar = harness.config.staging_dir / (session_id + ".json");
        assert(std::filesystem::exists(sidecar));

        harness.store.arm();
        ChunkAck ack{.ok = true};
        std::thread writer([&]
                           { ack = engine.upload_chunk(session_id, 5, chunk_of(payload, 5, kChunkSize)); });
        harness.store.wait_until_written();
        assert(engine.cancel_upload(session_id));
        harness.store.open_gate();
        writer.join();

        assert(!ack.ok);
        assert(!ack.duplicate);
        assert(harness.registry.size() == 0);
        assert(!harness.store.contains(session_id));
        assert(!std::filesystem::exists(harness.store.staging_path(session_id)));
        assert(!std::filesystem::exists(sidecar));
        assert(throws<SessionNotFoundError>([&]
                                            { (void)engine.get_upload_progress(session_id); }));
        harness.dispatcher.flush();
        const auto snapshot = harness.tracker.snapshot(session_id);
        assert(snapshot->status == TransferStatus::Cancelled);
        assert(snapshot->error_count == 0);
    }

    void test_session_index_drops_stale_records()
    {
        const auto root = make_temp_root("index");
        {
            SessionIndex index(root);
            TransferSession session("cafe01", "f", "a.bin", 3000, 1024, std::nullopt);
            IndexRecord older;
            IndexRecord newer;
            {
                std::lock_guard lock(session.mutex);
                older = SessionIndex::record(session);
                session.chunks[0].status = ChunkStatus::Completed;
                session.chunks[0].checksum = std::string(64, 'a');
                session.chunks[1].status = ChunkStatus::Uploading;
                newer = SessionIndex::record(session);
            }
            assert(newer.version > older.version);

            // Written out of order, the older record must not win.
            index.write("cafe01", newer);
            index.write("cafe01", older);
            auto loaded = index.load_all();
            assert(loaded.size() == 1);
            assert(loaded[0]->uploaded_chunks == 1);
            assert(loaded[0]->uploaded_bytes == 1024);
            assert(loaded[0]->chunks[0].checksum == std::string(64, 'a'));
            assert(loaded[0]->chunks[1].status == ChunkStatus::Pending);

            {
                std::ofstream partial(root / "cafe01.json.9.part");
                partial << "{";
            }
            index.remove("cafe01");
            IndexRecord late;
            {
                std::lock_guard lock(session.mutex);
                late = SessionIndex::record(session);
            }
            index.write("cafe01", late);
            assert(!std::filesystem::exists(root / "cafe01.json"));
            assert(index.load_all().empty());
            assert(!std::filesystem::exists(root / "cafe01.json.9.part"));
            assert(std::filesystem::is_empty(root));
        }
        cleanup_path(root);
    }

    void test_concurrent_chunk_uploads()
    {
        EngineHarness harness("concurrent");
        auto &engine = harness.engine;
        constexpr std::uint64_t chunk_size = 512;
        constexpr std::uint64_t total = 64 * chunk_size - 100;
        const auto payload = make_payload(total, 13);
        const auto session_id =
            engine.create_session("par", "data.bin", total, chunk_size, crypto::hash_bytes(payload));

        constexpr int kThreads = 8;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([&, t]
                                 {
                for (std::uint64_t chunk_id = t; chunk_id < 64; chunk_id += kThreads) {
                    const auto ack = engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, chunk_size));
                    assert(ack.ok);
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        const auto progress = engine.get_upload_progress(session_id);
        assert(progress.uploaded_chunks == 64);
        assert(progress.uploaded_bytes == total);
        const auto result = engine.complete_upload(session_id);
        assert(read_file(result.final_path) == payload);

        harness.dispatcher.flush();
        assert(harness.tracker.snapshot(session_id)->transferred_size == total);
    }

    void test_zero_size_file()
    {
        EngineHarness harness("empty");
        auto &engine = harness.engine;
        const auto session_id = engine.create_session("nil", "empty.txt", 0, kChunkSize);
        assert(engine.resume_upload(session_id).empty());
        assert(engine.get_upload_progress(session_id).progress_percent == 100.0);
        const auto result = engine.complete_upload(session_id);
        assert(result.ok);
        assert(std::filesystem::file_size(result.final_path) == 0);
    }

    void test_session_validation()
    {
        EngineConfig base;
        base.max_file_size = 4096;
        base.allowed_extensions = {".txt", ".bin"};
        EngineHarness harness("validation", base);
        auto &engine = harness.engine;

        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f", "a.txt", 10, 0); }));
        assert(throws<FileTooLargeError>([&]
                                         { engine.create_session("f", "a.txt", 4097, 1024); }));
        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f", "a.exe", 10, 1024); }));
        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f", "../a.txt", 10, 1024); }));
        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f/g", "a.txt", 10, 1024); }));
        assert(harness.registry.size() == 0);
        assert(std::filesystem::is_empty(harness.config.staging_dir));

        const auto session_id = engine.create_session("f", "A.TXT", 4096, 1024);
        assert(engine.get_upload_progress(session_id).total_chunks == 4);
    }

    void test_chunk_count_limit()
    {
        EngineConfig base;
        base.max_chunks = 16;
        base.max_file_size = 0;
        EngineHarness harness("limits", base);
        auto &engine = harness.engine;

        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f", "a.bin", 4096, 1); }));
        assert(throws<InvalidArgumentError>([&]
                                            { engine.create_session("f", "a.bin", 17, 1); }));
        assert(harness.registry.size() == 0);
        assert(std::filesystem::is_empty(harness.config.staging_dir));
        const auto session_id = engine.create_session("f", "a.bin", 16, 1);
        assert(engine.get_upload_progress(session_id).total_chunks == 16);

        // The default limit stops a byte-sized chunk plan before any table is built.
        EngineHarness defaults("limits_default");
        assert(throws<InvalidArgumentError>([&]
                                            { defaults.engine.create_session("f", "a.bin", 100ULL << 20, 1); }));
        assert(defaults.registry.size() == 0);

        // Sizes that fit the limit still fail cleanly when the disk cannot hold them.
        assert(throws<AllocationError>([&]
                                       { engine.create_session("f", "b.bin", 1ULL << 62, 1ULL << 60); }));
        assert(harness.registry.size() == 1);
    }

    void test_pause_and_resume_session()
    {
        EngineHarness harness("pause");
        auto &engine = harness.engine;
        const auto payload = make_payload(kTotalSize, 14);
        const auto session_id = engine.create_session("pau", "data.bin", kTotalSize, kChunkSize);
        engine.upload_chunk(session_id, 0, chunk_of(payload, 0, kChunkSize));

        assert(engine.pause_upload(session_id));
        assert(!engine.pause_upload(session_id));
        assert(harness.tracker.snapshot(session_id)->status == TransferStatus::Paused);

        // Chunks are still accepted while paused.
        assert(engine.upload_chunk(session_id, 1, chunk_of(payload, 1, kChunkSize)).ok);
        assert(harness.tracker.snapshot(session_id)->status == TransferStatus::Paused);

        assert(engine.resume_upload(session_id).size() == 11);
        assert(harness.tracker.snapshot(session_id)->status == TransferStatus::InProgress);
        assert(!engine.unpause_upload(session_id));
        assert(throws<SessionNotFoundError>([&]
                                            { (void)engine.pause_upload("abcdef"); }));
    }

    void test_idle_sessions_expire()
    {
        EngineHarness harness("expiry");
        auto &engine = harness.engine;
        const auto session_id = engine.create_session("old", "data.bin", kTotalSize, kChunkSize);

        assert(engine.expire_idle_sessions().empty());
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        const auto expired = engine.expire_idle_sessions(std::chrono::seconds(0));
        assert(expired == std::vector<std::string>{session_id});
        assert(harness.registry.size() == 0);
        assert(!std::filesystem::exists(harness.store.staging_path(session_id)));

        const auto snapshot = harness.tracker.snapshot(session_id);
        assert(snapshot->status == TransferStatus::Failed);
        assert(snapshot->last_error.has_value());
        assert(engine.expire_idle_sessions(std::chrono::seconds(0)).empty());
    }

    void test_persisted_sessions_restore()
    {
        const auto root = make_temp_root("restore");
        EngineConfig base;
        base.persist_index = true;
        const auto config = make_config(root, base);
        const auto payload = make_payload(kTotalSize, 15);
        const auto checksum = crypto::hash_bytes(payload);

        std::string session_id;
        {
            EventDispatcher dispatcher;
            ChunkStore store(config.staging_dir, config.upload_dir);
            SessionRegistry registry;
            ProgressTracker tracker(dispatcher);
            ChunkedUploadEngine engine(config, store, registry, tracker);
            session_id = engine.create_session("keep", "data.bin", kTotalSize, kChunkSize, checksum);
            for (const std::uint64_t chunk_id : {1ULL, 4ULL, 12ULL})
            {
                engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
            }
            assert(std::filesystem::exists(config.staging_dir / (session_id + ".json")));
        }

        {
            EventDispatcher dispatcher;
            ChunkStore store(config.staging_dir, config.upload_dir);
            SessionRegistry registry;
            ProgressTracker tracker(dispatcher);
            ChunkedUploadEngine engine(config, store, registry, tracker);
            assert(engine.restore_sessions() == 1);
            assert(engine.restore_sessions() == 0);

            const auto progress = engine.get_upload_progress(session_id);
            assert(progress.uploaded_chunks == 3);
            assert(progress.uploaded_bytes == 2 * kChunkSize + 520);
            assert(tracker.snapshot(session_id)->transferred_size == progress.uploaded_bytes);

            const std::vector<std::uint64_t> expected{0, 2, 3, 5, 6, 7, 8, 9, 10, 11};
            assert(engine.resume_upload(session_id) == expected);
            assert(engine.upload_chunk(session_id, 4, chunk_of(payload, 4, kChunkSize)).duplicate);
            for (const auto chunk_id : expected)
            {
                engine.upload_chunk(session_id, chunk_id, chunk_of(payload, chunk_id, kChunkSize));
            }
            const auto result = engine.complete_upload(session_id);
            assert(result.checksum == checksum);
            assert(read_file(result.final_path) == payload);
            assert(!std::filesystem::exists(config.staging_dir / (session_id + ".json")));
        }

        // A sidecar whose staging file vanished is dropped on restore.
        {
            EventDispatcher dispatcher;
            ChunkStore store(config.staging_dir, config.upload_dir);
            SessionRegistry registry;
            ProgressTracker tracker(dispatcher);
            ChunkedUploadEngine engine(config, store, registry, tracker);
            const auto orphan = engine.create_session("gone", "data.bin", kTotalSize, kChunkSize);
            assert(store.release(orphan));

            SessionRegistry fresh_registry;
            ChunkStore fresh_store(config.staging_dir, config.upload_dir);
            ChunkedUploadEngine fresh(config, fresh_store, fresh_registry, tracker);
            assert(fresh.restore_sessions() == 0);
            assert(!std::filesystem::exists(config.staging_dir / (orphan + ".json")));
        }
        cleanup_path(root);
    }

    void test_load_config_file()
    {
        const auto root = make_temp_root("config");
        const auto path = root / "chunkdrive.json";
        {
            std::ofstream out(path);
            out << R"({
                "storage": {
                    "staging_dir": "/var/tmp/staging",
                    "upload_dir": "/var/tmp/uploads",
                    "max_file_size": 2048,
                    "allowed_extensions": ["TXT", ".pdf"],
                    "idle_ttl": 90,
                    "persist_index": true,
                    "max_chunks": 5000
                },
                "service": {
                    "worker_threads": 3,
                    "chunk_size": 4096,
                    "sweep_interval": 15
                },
                "logging": {
                    "file": "/var/tmp/chunkdrive.log",
                    "verbose": true
                }
            })";
        }

        const auto config = load_config_file(path);
        assert(config.engine.staging_dir == "/var/tmp/staging");
        assert(config.engine.upload_dir == "/var/tmp/uploads");
        assert(config.engine.max_file_size == 2048);
        assert((config.engine.allowed_extensions == std::vector<std::string>{".txt", ".pdf"}));
        assert(config.engine.idle_ttl == std::chrono::seconds(90));
        assert(config.engine.persist_index);
        assert(config.engine.max_chunks == 5000);
        assert(config.worker_threads == 3);
        assert(config.ingest_chunk_size == 4096);
        assert(config.sweep_interval == std::chrono::seconds(15));
        assert(config.progress_retention == std::chrono::seconds(300));
        assert(config.speed_window == 10);
        assert(config.log_file == std::filesystem::path("/var/tmp/chunkdrive.log"));
        assert(config.verbose);

        assert(throws<std::runtime_error>([&]
                                          { (void)load_config_file(root / "missing.json"); }));
        cleanup_path(root);
    }

} // namespace

void run_engine_component_tests()
{
    test_chunk_plan();
    test_chunk_store_positioned_writes();
    test_session_registry();
    test_out_of_order_upload_completes();
    test_reverse_order_matches_forward_order();
    test_duplicate_chunk_is_idempotent();
    test_resume_returns_complement();
    test_incomplete_completion_reports_missing();
    test_cancel_mid_upload();
    test_rejected_chunks_leave_state_unchanged();
    test_integrity_mismatch_keeps_staging();
    test_write_failure_marks_chunk_failed();
    test_failed_merge_can_be_retried();
    test_same_chunk_in_flight_is_busy();
    test_write_racing_cancel_is_discarded();
    test_session_index_drops_stale_records();
    test_concurrent_chunk_uploads();
    test_zero_size_file();
    test_session_validation();
    test_chunk_count_limit();
    test_pause_and_resume_session();
    test_idle_sessions_expire();
    test_persisted_sessions_restore();
    test_load_config_file();
}

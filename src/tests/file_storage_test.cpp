#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include "backend/memory_backend.hpp"
#include "crypto/checksum.hpp"
#include "storage/file_storage.hpp"
#include "storage/key_layout.hpp"
#include "test_utils.hpp"

using namespace chunkvault::storage;
using chunkvault::backend::BackendError;
using chunkvault::backend::Bytes;
using chunkvault::backend::MemoryBackend;
using chunkvault::backend::StorageBackend;
using chunkvault::test::make_content;
using chunkvault::test::to_bytes;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Not;

// Forwards everything to a real MemoryBackend unless a test overrides a call
class MockBackend : public StorageBackend {
public:
  MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
  MOCK_METHOD(std::optional<Bytes>, get_binary, (const std::string& key), (override));
  MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
  MOCK_METHOD(void, set_binary, (const std::string& key, const Bytes& value), (override));
  MOCK_METHOD(void, append_to_list, (const std::string& list_key, const std::string& value), (override));
  MOCK_METHOD(std::vector<std::string>, get_full_list, (const std::string& list_key), (override));
  MOCK_METHOD(std::vector<std::string>, list_keys, (const std::string& pattern), (override));

  void delegate_to(MemoryBackend& real) {
    ON_CALL(*this, get(_)).WillByDefault(Invoke(&real, &MemoryBackend::get));
    ON_CALL(*this, get_binary(_)).WillByDefault(Invoke(&real, &MemoryBackend::get_binary));
    ON_CALL(*this, set(_, _)).WillByDefault(Invoke(&real, &MemoryBackend::set));
    ON_CALL(*this, set_binary(_, _)).WillByDefault(Invoke(&real, &MemoryBackend::set_binary));
    ON_CALL(*this, append_to_list(_, _)).WillByDefault(Invoke(&real, &MemoryBackend::append_to_list));
    ON_CALL(*this, get_full_list(_)).WillByDefault(Invoke(&real, &MemoryBackend::get_full_list));
    ON_CALL(*this, list_keys(_)).WillByDefault(Invoke(&real, &MemoryBackend::list_keys));
  }
};

class FixedProbe : public MemoryProbe {
public:
  explicit FixedProbe(double ratio) : ratio(ratio) {}
  double usage_ratio() override { return ratio; }
  double ratio;
};

class FileStorageTest : public ::testing::Test {
protected:
  MemoryBackend real_backend;
  NiceMock<MockBackend> backend;
  FixedProbe probe{0.1};
  StorageConfig config;
  std::unique_ptr<FileStorage> storage;

  void SetUp() override {
    chunkvault::test::init_test_logging("fatal");
    backend.delegate_to(real_backend);
    config.max_chunk_size = 1024 * 1024;
    storage = std::make_unique<FileStorage>(backend, config, probe);
  }

  void TearDown() override {
    storage.reset();
    real_backend.clear();
  }

  // Helper methods to reduce repetition
  void upload(const std::string& name, const Bytes& content, std::size_t chunk_size, int parallel = 1) {
    BufferByteSource source(content, 100);
    storage->upload_file(source, name, chunk_size, parallel);
  }

  void upload_and_verify(const std::string& name, const Bytes& content, std::size_t chunk_size, int parallel = 1) {
    ASSERT_NO_THROW(upload(name, content, chunk_size, parallel)) << "Failed to upload: " << name;

    Bytes downloaded;
    ASSERT_NO_THROW(downloaded = storage->download_file(name, parallel)) << "Failed to download: " << name;
    EXPECT_EQ(downloaded, content) << "Content mismatch for " << name << " with chunk size " << chunk_size;
  }

  std::vector<std::string> chunk_keys(const std::string& name) {
    auto keys = real_backend.list_keys("chunk:" + name + ":*");
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  bool slot_is_blank(const std::string& name, std::size_t index) {
    auto value = real_backend.get_binary(chunk_key(name, index));
    return value.has_value() && value->empty();
  }

  static Bytes random_bytes(std::size_t size, unsigned seed) {
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    Bytes bytes(size);
    for (auto& byte : bytes) {
      byte = static_cast<std::uint8_t>(distribution(generator));
    }
    return bytes;
  }
};


//==============================================
// ROUND TRIP
//==============================================

TEST_F(FileStorageTest, RoundTripAcrossChunkSizes) {
  const auto content = make_content(1000);
  for (std::size_t chunk_size : {1u, 7u, 100u, 300u, 999u, 1000u, 1001u, 4096u}) {
    upload_and_verify("sizes-" + std::to_string(chunk_size), content, chunk_size);
  }
}

TEST_F(FileStorageTest, RandomBufferInQuarterChunks) {
  const std::string name = "test-buffer-file.txt";
  const auto content = random_bytes(1024, 42);
  const auto expected_digest = chunkvault::crypto::compute_checksum(content);

  upload_and_verify(name, content, 256);

  const auto metadata = storage->get_metadata(name);
  EXPECT_EQ(metadata.total_chunks, 4u);
  EXPECT_EQ(metadata.chunk_size, 256u);
  EXPECT_EQ(metadata.total_size, 1024u);
  EXPECT_EQ(metadata.checksum, expected_digest);
  EXPECT_EQ(chunkvault::crypto::compute_checksum(storage->download_file(name)), expected_digest);

  for (std::size_t i = 0; i < 4; ++i) {
    auto chunk = real_backend.get_binary(chunk_key(name, i));
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk, Bytes(content.begin() + i * 256, content.begin() + (i + 1) * 256));
  }
}

TEST_F(FileStorageTest, ChunkCountMatchesLayout) {
  upload("layout.bin", make_content(1000), 300);

  const auto metadata = storage->get_metadata("layout.bin");
  EXPECT_EQ(metadata.total_chunks, 4u);
  EXPECT_EQ(chunk_keys("layout.bin").size(), 4u);
  EXPECT_FALSE(real_backend.get_binary(chunk_key("layout.bin", 4)).has_value());
  EXPECT_EQ(real_backend.get_binary(chunk_key("layout.bin", 3))->size(), 100u);
}

TEST_F(FileStorageTest, ParallelismSettingsAllRoundTrip) {
  const auto content = make_content(5000);
  for (int parallel : {0, -1, 1, 50}) {
    upload_and_verify("parallel" + std::to_string(parallel) + ".bin", content, 64, parallel);
  }
}

TEST_F(FileStorageTest, EmptyFileRoundTrips) {
  upload_and_verify("empty.txt", Bytes(), 256);

  const auto metadata = storage->get_metadata("empty.txt");
  EXPECT_EQ(metadata.total_chunks, 0u);
  EXPECT_EQ(metadata.total_size, 0u);
  EXPECT_EQ(metadata.checksum, "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  EXPECT_TRUE(chunk_keys("empty.txt").empty());
}

TEST_F(FileStorageTest, IstreamUploadRoundTrips) {
  std::string text = "line one\nline two\r\n";
  text.push_back('\0');
  text += "binary tail";
  std::istringstream input(text);
  IstreamByteSource source(input, 5);

  storage->upload_file(source, "stream.txt", 4);
  const auto downloaded = storage->download_file("stream.txt");
  EXPECT_EQ(std::string(downloaded.begin(), downloaded.end()), text);
}


//==============================================
// LISTING AND METADATA
//==============================================

TEST_F(FileStorageTest, ListsUploadedFilesOnceInFirstUploadOrder) {
  EXPECT_TRUE(storage->list_uploaded_files().empty());

  upload("a.txt", to_bytes("first"), 4);
  upload("b.txt", to_bytes("second"), 4);
  upload("c.txt", to_bytes("third"), 4);
  upload("a.txt", to_bytes("first again"), 4);

  const std::vector<std::string> expected = {"a.txt", "b.txt", "c.txt"};
  EXPECT_EQ(storage->list_uploaded_files(), expected);
  EXPECT_EQ(real_backend.get_full_list(FILE_INDEX_KEY).size(), 4u);
}

TEST_F(FileStorageTest, ExistsAndMetadataLookup) {
  EXPECT_FALSE(storage->exists("doc.txt"));
  EXPECT_THROW(storage->get_metadata("doc.txt"), NotFoundError);

  upload("doc.txt", to_bytes("hello world"), 4);

  EXPECT_TRUE(storage->exists("doc.txt"));
  const auto metadata = storage->get_metadata("doc.txt");
  EXPECT_EQ(metadata.file_name, "doc.txt");
  EXPECT_EQ(metadata.total_chunks, 3u);
  EXPECT_FALSE(metadata.created_at.is_special());
}

TEST_F(FileStorageTest, ReuploadOverwritesContent) {
  upload("doc.txt", to_bytes("version one"), 4);
  upload_and_verify("doc.txt", to_bytes("version two is longer"), 4);
}

TEST_F(FileStorageTest, ReuploadWithFewerChunksBlanksStaleSlots) {
  upload("shrink.bin", make_content(1024), 256);
  upload_and_verify("shrink.bin", make_content(300), 256);

  EXPECT_EQ(storage->get_metadata("shrink.bin").total_chunks, 2u);
  EXPECT_FALSE(slot_is_blank("shrink.bin", 1));
  EXPECT_TRUE(slot_is_blank("shrink.bin", 2));
  EXPECT_TRUE(slot_is_blank("shrink.bin", 3));
}


//==============================================
// DOWNLOAD FAILURES
//==============================================

TEST_F(FileStorageTest, MissingFileIsNotFound) {
  try {
    storage->download_file("missing.bin");
    FAIL() << "Expected NotFoundError";
  } catch (const MissingChunkError&) {
    FAIL() << "Missing file must not be reported as a missing chunk";
  } catch (const NotFoundError& e) {
    EXPECT_NE(std::string(e.what()).find("missing.bin"), std::string::npos);
  }
}

TEST_F(FileStorageTest, AlteredChunkFailsIntegrityCheck) {
  const auto content = make_content(1024);
  upload("tampered.bin", content, 256);

  Bytes altered(content.begin() + 256, content.begin() + 512);
  altered[17] ^= 0xFF;
  real_backend.set_binary(chunk_key("tampered.bin", 1), altered);

  EXPECT_THROW(storage->download_file("tampered.bin"), IntegrityError);
}

TEST_F(FileStorageTest, TruncatedChunkFailsIntegrityCheck) {
  upload("short.bin", make_content(1024), 256);
  real_backend.set_binary(chunk_key("short.bin", 2), Bytes(10, 0x01));

  EXPECT_THROW(storage->download_file("short.bin", 4), IntegrityError);
}

TEST_F(FileStorageTest, BlankedChunkIsIntegrityErrorNotMissing) {
  upload("blank.bin", make_content(1024), 256);
  real_backend.set_binary(chunk_key("blank.bin", 0), Bytes());

  EXPECT_THROW(storage->download_file("blank.bin"), IntegrityError);
}

TEST_F(FileStorageTest, AbsentChunkIsMissingChunkError) {
  upload("holes.bin", make_content(1024), 256);
  ON_CALL(backend, get_binary(chunk_key("holes.bin", 2)))
    .WillByDefault([](const std::string&) { return std::optional<Bytes>(); });

  try {
    storage->download_file("holes.bin", 4);
    FAIL() << "Expected MissingChunkError";
  } catch (const MissingChunkError& e) {
    EXPECT_EQ(e.index(), 2u);
  }
}

TEST_F(FileStorageTest, CorruptMetadataIsInvalidMetadata) {
  real_backend.set(meta_key("corrupt.bin"), "fileName=corrupt.bin\ntotalChunks=lots\n");
  EXPECT_THROW(storage->download_file("corrupt.bin"), InvalidMetadataError);

  upload("real.bin", make_content(10), 4);
  auto text = *real_backend.get(meta_key("real.bin"));
  real_backend.set(meta_key("alias.bin"), text);
  EXPECT_THROW(storage->download_file("alias.bin"), InvalidMetadataError);
}

TEST_F(FileStorageTest, BackendReadFailurePropagates) {
  upload("flaky.bin", make_content(1024), 256);
  ON_CALL(backend, get_binary(chunk_key("flaky.bin", 1)))
    .WillByDefault([](const std::string&) -> std::optional<Bytes> { throw BackendError("connection reset"); });

  EXPECT_THROW(storage->download_file("flaky.bin", 2), BackendError);
}


//==============================================
// UPLOAD FAILURES
//==============================================

TEST_F(FileStorageTest, InvalidArgumentsRejectedBeforeAnyWrite) {
  EXPECT_CALL(backend, set_binary(_, _)).Times(0);
  EXPECT_CALL(backend, set(_, _)).Times(0);
  EXPECT_CALL(backend, append_to_list(_, _)).Times(0);

  EXPECT_THROW(upload("", to_bytes("x"), 4), ValidationError);
  EXPECT_THROW(upload("bad\nname", to_bytes("x"), 4), ValidationError);
  EXPECT_THROW(upload("zero.bin", to_bytes("x"), 0), ValidationError);
  EXPECT_THROW(upload("huge.bin", to_bytes("x"), config.max_chunk_size + 1), ValidationError);
}

TEST_F(FileStorageTest, MemoryPressureRejectsUploadWithoutWrites) {
  probe.ratio = 0.95;
  EXPECT_CALL(backend, set_binary(_, _)).Times(0);
  EXPECT_CALL(backend, set(_, _)).Times(0);
  EXPECT_CALL(backend, append_to_list(_, _)).Times(0);

  try {
    upload("pressure.bin", make_content(1024), 256);
    FAIL() << "Expected ResourcePressureError";
  } catch (const ResourcePressureError& e) {
    EXPECT_TRUE(e.retryable());
  }
  EXPECT_FALSE(storage->exists("pressure.bin"));
}

TEST_F(FileStorageTest, ChunkWriteFailureCleansUpAndRethrows) {
  const std::string name = "broken.bin";
  ON_CALL(backend, set_binary(chunk_key(name, 2), Not(::testing::IsEmpty())))
    .WillByDefault([](const std::string&, const Bytes&) { throw BackendError("disk full"); });

  try {
    upload(name, make_content(1024), 256);
    FAIL() << "Expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_NE(std::string(e.what()).find("disk full"), std::string::npos);
  }

  EXPECT_FALSE(real_backend.get(meta_key(name)).has_value());
  EXPECT_TRUE(storage->list_uploaded_files().empty());
  EXPECT_TRUE(slot_is_blank(name, 0));
  EXPECT_TRUE(slot_is_blank(name, 1));
  EXPECT_FALSE(real_backend.get_binary(chunk_key(name, 3)).has_value());
}

TEST_F(FileStorageTest, ParallelChunkWriteFailureBlanksEveryCompletedSlot) {
  const std::string name = "parallel-broken.bin";
  ON_CALL(backend, set_binary(chunk_key(name, 1), Not(::testing::IsEmpty())))
    .WillByDefault([](const std::string&, const Bytes&) { throw BackendError("timeout"); });

  EXPECT_THROW(upload(name, make_content(1024), 256, 4), BackendError);

  EXPECT_FALSE(storage->exists(name));
  for (std::size_t i : {0u, 2u, 3u}) {
    EXPECT_TRUE(slot_is_blank(name, i)) << "Chunk " << i << " should be blanked";
  }
}

TEST_F(FileStorageTest, OriginalErrorSurvivesFailingCleanup) {
  const std::string name = "double-fault.bin";
  ON_CALL(backend, set_binary(chunk_key(name, 3), _))
    .WillByDefault([](const std::string&, const Bytes&) { throw BackendError("original failure"); });
  ON_CALL(backend, set_binary(_, ::testing::IsEmpty()))
    .WillByDefault([](const std::string&, const Bytes&) { throw BackendError("cleanup failure"); });

  try {
    upload(name, make_content(1024), 256);
    FAIL() << "Expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_NE(std::string(e.what()).find("original failure"), std::string::npos);
  }
  EXPECT_FALSE(storage->exists(name));
}

TEST_F(FileStorageTest, MetadataWriteFailureBlanksAllChunks) {
  const std::string name = "no-meta.bin";
  ON_CALL(backend, set(meta_key(name), _))
    .WillByDefault([](const std::string&, const std::string&) { throw BackendError("metadata rejected"); });
  EXPECT_CALL(backend, append_to_list(_, _)).Times(0);

  EXPECT_THROW(upload(name, make_content(1024), 256), BackendError);

  for (std::size_t i = 0; i < 4; ++i) {
    EXPECT_TRUE(slot_is_blank(name, i)) << "Chunk " << i << " should be blanked";
  }
}

TEST_F(FileStorageTest, FailedReuploadKeepsPreviousMetadata) {
  const std::string name = "kept.bin";
  upload(name, make_content(100), 50);
  const auto before = storage->get_metadata(name);

  ON_CALL(backend, set_binary(chunk_key(name, 0), Not(::testing::IsEmpty())))
    .WillByDefault([](const std::string&, const Bytes&) { throw BackendError("write refused"); });
  EXPECT_THROW(upload(name, make_content(400), 50), BackendError);

  EXPECT_EQ(storage->get_metadata(name), before);
}


//==============================================
// UNTRUSTED METADATA
//==============================================

namespace {

std::string meta_record(const std::string& name, const std::string& total_chunks,
                        const std::string& chunk_size, const std::string& total_size,
                        const std::string& checksum = std::string(40, 'a')) {
  return "fileName=" + name + "\n"
         "totalChunks=" + total_chunks + "\n"
         "chunkSize=" + chunk_size + "\n"
         "totalSize=" + total_size + "\n"
         "checksum=" + checksum + "\n"
         "createdAt=2024-05-17T09:30:15Z\n";
}

}  // namespace

TEST_F(FileStorageTest, OversizedChunkSizeInMetadataIsInvalid) {
  real_backend.set(meta_key("huge.bin"),
                   meta_record("huge.bin", "1", "1000000000000000", "1000000000000000"));

  EXPECT_THROW(storage->get_metadata("huge.bin"), InvalidMetadataError);
  EXPECT_THROW(storage->download_file("huge.bin"), InvalidMetadataError);
}

TEST_F(FileStorageTest, UppercaseStoredDigestIsInvalid) {
  upload("case.bin", make_content(10), 4);
  auto text = *real_backend.get(meta_key("case.bin"));
  const auto at = text.find("checksum=") + 9;
  std::transform(text.begin() + at, text.begin() + at + 40, text.begin() + at,
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  real_backend.set(meta_key("case.bin"), text);

  EXPECT_THROW(storage->download_file("case.bin"), InvalidMetadataError);
}

TEST_F(FileStorageTest, InconsistentPreviousRecordDoesNotDriveCleanup) {
  real_backend.set(meta_key("bogus.bin"),
                   meta_record("bogus.bin", "18446744073709551615", "4", "10"));

  upload_and_verify("bogus.bin", make_content(10), 4);
  EXPECT_EQ(chunk_keys("bogus.bin").size(), 3u);
}

TEST_F(FileStorageTest, StaleCleanupOnlyTouchesExistingSlots) {
  // Consistent but enormous layout, of which only five slots exist
  real_backend.set(meta_key("wide.bin"),
                   meta_record("wide.bin", "1000000000000", "1", "1000000000000"));
  for (std::size_t i = 0; i < 5; ++i) {
    real_backend.set_binary(chunk_key("wide.bin", i), Bytes(1, 0x42));
  }
  real_backend.set_binary("chunk:wide.bin:x", Bytes(1, 0x42));

  upload_and_verify("wide.bin", make_content(10), 4);

  EXPECT_EQ(chunk_keys("wide.bin").size(), 6u);
  EXPECT_FALSE(slot_is_blank("wide.bin", 2));
  EXPECT_TRUE(slot_is_blank("wide.bin", 3));
  EXPECT_TRUE(slot_is_blank("wide.bin", 4));
  EXPECT_EQ(*real_backend.get_binary("chunk:wide.bin:x"), Bytes(1, 0x42));
}

TEST_F(FileStorageTest, WildcardNameCleanupLeavesOtherFilesAlone) {
  const auto neighbour = make_content(1024);
  upload("aXb", neighbour, 256);
  upload("a*b", make_content(1024), 256);

  upload_and_verify("a*b", make_content(300), 256);

  EXPECT_TRUE(slot_is_blank("a*b", 2));
  EXPECT_TRUE(slot_is_blank("a*b", 3));
  EXPECT_FALSE(slot_is_blank("aXb", 2));
  EXPECT_FALSE(slot_is_blank("aXb", 3));
  EXPECT_EQ(storage->download_file("aXb"), neighbour);
}

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

#include "snip/store/sqlite_attachment_store.hpp"
#include "test_helpers.hpp"

using namespace snip::store;
using namespace snip::core;
using namespace snip::test;
using snip::ErrorCode;

namespace {

constexpr const char* kFirstId = "65f6930f-1c2a-4e8b-9d3f-0a1b2c3d4e5f";
constexpr const char* kSecondId = "990a917e-5b4c-4f2a-8e1d-7c6b5a493827";
constexpr const char* kThirdId = "412f7ca8-3e9d-4b1a-a2c7-9e8d7f6a5b40";
constexpr const char* kSnipId = "ba652e2d-b248-4bcc-b36e-c26c0d0e8002";

}  // namespace

class SqliteAttachmentStoreTest : public DatabaseTest {
protected:
  void SetUp() override {
    DatabaseTest::SetUp();
    if (HasFatalFailure()) {
      return;
    }
    store_ = std::make_unique<SqliteAttachmentStore>(*db_);
  }

  void TearDown() override {
    store_.reset();
    DatabaseTest::TearDown();
  }

  void insertScenario() {
    ASSERT_OK(store_->insert(makeAttachment(kFirstId, "first", "first.txt")));
    ASSERT_OK(store_->insert(makeAttachment(kSecondId, "second", "second.txt")));
    ASSERT_OK(store_->insert(makeAttachment(kThirdId, "third", "third.txt")));
  }

  std::unique_ptr<SqliteAttachmentStore> store_;
};

TEST_F(SqliteAttachmentStoreTest, InsertAndGetRoundTrip) {
  std::string binary("\x00\x01\xff\xfe" "PDF\x00tail", 12);
  auto original = makeAttachment(kFirstId, binary, "udhr.pdf");

  ASSERT_OK(store_->insert(original));

  auto fetched = store_->get(original.id);
  ASSERT_OK(fetched);
  EXPECT_EQ(fetched->id, original.id);
  EXPECT_EQ(fetched->parent_id, original.parent_id);
  EXPECT_EQ(fetched->name, "udhr.pdf");
  EXPECT_EQ(fetched->size, 12u);
  EXPECT_EQ(fetched->data, binary);
  EXPECT_EQ(fetched->timestamp, original.timestamp);
}

TEST_F(SqliteAttachmentStoreTest, EmptyPayloadRoundTrip) {
  auto original = makeAttachment(kFirstId, "");
  ASSERT_OK(store_->insert(original));

  auto fetched = store_->resolve(kFirstId);
  ASSERT_OK(fetched);
  EXPECT_TRUE(fetched->data.empty());
  EXPECT_EQ(fetched->size, 0u);
}

TEST_F(SqliteAttachmentStoreTest, ResolveScenario) {
  insertScenario();

  auto first = store_->resolve("65f6930f");
  ASSERT_OK(first);
  EXPECT_EQ(first->id.toString(), kFirstId);
  EXPECT_EQ(first->data, "first");

  EXPECT_ERROR(store_->resolve("f"), ErrorCode::kAmbiguousMatch);

  auto second_id = AttachmentId::fromString(kSecondId);
  ASSERT_OK(second_id);
  ASSERT_OK(store_->remove(*second_id));

  EXPECT_ERROR(store_->resolve("990a917e"), ErrorCode::kNotFound);
}

TEST_F(SqliteAttachmentStoreTest, ResolveMatchesAnySubstring) {
  insertScenario();

  const std::string id = kThirdId;  // 412f7ca8-3e9d-4b1a-a2c7-9e8d7f6a5b40
  std::vector<std::string> partials = {
    id.substr(0, 8),    // segment 1
    id.substr(9, 4),    // segment 2
    id.substr(14, 4),   // segment 3
    id.substr(19, 4),   // segment 4
    id.substr(24),      // segment 5
    id.substr(7, 5),    // across first hyphen
    id.substr(8, 11),   // hyphen to hyphen
    id.substr(23),      // leading hyphen
    id,
  };

  for (const auto& partial : partials) {
    auto result = store_->resolve(partial);
    ASSERT_TRUE(result.has_value()) << "partial: " << partial << " error: " << result.error().message();
    EXPECT_EQ(result->id.toString(), id) << "partial: " << partial;
  }
}

TEST_F(SqliteAttachmentStoreTest, ResolveIsCaseInsensitive) {
  insertScenario();

  auto result = store_->resolve("65F6930F");
  ASSERT_OK(result);
  EXPECT_EQ(result->id.toString(), kFirstId);
}

TEST_F(SqliteAttachmentStoreTest, ResolveTreatsWildcardsLiterally) {
  insertScenario();

  EXPECT_ERROR(store_->resolve("_"), ErrorCode::kNotFound);
  EXPECT_ERROR(store_->resolve("%"), ErrorCode::kNotFound);
  EXPECT_ERROR(store_->resolve("65f6930f%"), ErrorCode::kNotFound);
}

TEST_F(SqliteAttachmentStoreTest, ResolveNotFoundOnEmptyStore) {
  EXPECT_ERROR(store_->resolve("65f6930f"), ErrorCode::kNotFound);
}

TEST_F(SqliteAttachmentStoreTest, EmptyPatternResolvesOnlyWithSingleRow) {
  ASSERT_OK(store_->insert(makeAttachment(kFirstId, "first")));
  auto single = store_->resolve("");
  ASSERT_OK(single);
  EXPECT_EQ(single->id.toString(), kFirstId);

  ASSERT_OK(store_->insert(makeAttachment(kSecondId, "second")));
  EXPECT_ERROR(store_->resolve(""), ErrorCode::kAmbiguousMatch);
}

TEST_F(SqliteAttachmentStoreTest, ResolveReturnsStoredSizeNotPayloadLength) {
  RawAttachmentRow row;
  row.uuid = kFirstId;
  row.data = "abc";
  row.size = "10";
  insertRawRow(*db_, row);

  auto result = store_->resolve("65f6930f");
  ASSERT_OK(result);
  EXPECT_EQ(result->size, 10u);
  EXPECT_EQ(result->data, "abc");
}

TEST_F(SqliteAttachmentStoreTest, ResolveAcceptsOffsetTimestamp) {
  RawAttachmentRow row;
  row.uuid = kFirstId;
  row.timestamp = "2023-04-12T20:21:43.409526+02:00";
  insertRawRow(*db_, row);

  RawAttachmentRow utc_row;
  utc_row.uuid = kSecondId;
  utc_row.timestamp = "2023-04-12T18:21:43.409526Z";
  insertRawRow(*db_, utc_row);

  auto with_offset = store_->resolve(kFirstId);
  auto in_utc = store_->resolve(kSecondId);
  ASSERT_OK(with_offset);
  ASSERT_OK(in_utc);
  EXPECT_EQ(with_offset->timestamp, in_utc->timestamp);
}

TEST_F(SqliteAttachmentStoreTest, ResolveDecodeErrors) {
  RawAttachmentRow bad_size;
  bad_size.uuid = kFirstId;
  bad_size.size = "twelve";
  insertRawRow(*db_, bad_size);

  RawAttachmentRow bad_timestamp;
  bad_timestamp.uuid = kSecondId;
  bad_timestamp.timestamp = "12/04/2023 18:21";
  insertRawRow(*db_, bad_timestamp);

  RawAttachmentRow bad_snip;
  bad_snip.uuid = kThirdId;
  bad_snip.snip_uuid = "not-a-uuid";
  insertRawRow(*db_, bad_snip);

  RawAttachmentRow bad_uuid;
  bad_uuid.uuid = "deadbeef";
  insertRawRow(*db_, bad_uuid);

  EXPECT_ERROR(store_->resolve("65f6930f"), ErrorCode::kDecodeError);
  EXPECT_ERROR(store_->resolve("990a917e"), ErrorCode::kDecodeError);
  EXPECT_ERROR(store_->resolve("412f7ca8"), ErrorCode::kDecodeError);
  EXPECT_ERROR(store_->resolve("deadbeef"), ErrorCode::kDecodeError);
}

TEST_F(SqliteAttachmentStoreTest, AmbiguityIsReportedBeforeDecoding) {
  RawAttachmentRow malformed;
  malformed.uuid = kFirstId;
  malformed.size = "-1";
  insertRawRow(*db_, malformed);

  RawAttachmentRow duplicate;
  duplicate.uuid = kFirstId;
  insertRawRow(*db_, duplicate);

  EXPECT_ERROR(store_->resolve("65f6930f"), ErrorCode::kAmbiguousMatch);
}

TEST_F(SqliteAttachmentStoreTest, GetMetadataLeavesDataEmpty) {
  auto original = makeAttachment(kFirstId, std::string(4096, 'x'), "big.bin");
  ASSERT_OK(store_->insert(original));

  auto metadata = store_->getMetadata(original.id);
  ASSERT_OK(metadata);
  EXPECT_EQ(metadata->id, original.id);
  EXPECT_EQ(metadata->parent_id, original.parent_id);
  EXPECT_EQ(metadata->name, "big.bin");
  EXPECT_EQ(metadata->size, 4096u);
  EXPECT_EQ(metadata->timestamp, original.timestamp);
  EXPECT_TRUE(metadata->data.empty());
}

TEST_F(SqliteAttachmentStoreTest, GetMetadataRequiresExactId) {
  insertScenario();

  // Exact lookup: a prefix is not an id
  auto id = AttachmentId::fromString("65f6930f-0000-0000-0000-000000000000");
  ASSERT_OK(id);
  EXPECT_ERROR(store_->getMetadata(*id), ErrorCode::kNotFound);
}

TEST_F(SqliteAttachmentStoreTest, GetMetadataDuplicateIdIsAmbiguous) {
  RawAttachmentRow row;
  row.uuid = kFirstId;
  insertRawRow(*db_, row);
  insertRawRow(*db_, row);

  auto id = AttachmentId::fromString(kFirstId);
  ASSERT_OK(id);
  EXPECT_ERROR(store_->getMetadata(*id), ErrorCode::kAmbiguousMatch);
  EXPECT_ERROR(store_->get(*id), ErrorCode::kAmbiguousMatch);
}

TEST_F(SqliteAttachmentStoreTest, GetMetadataDecodeError) {
  RawAttachmentRow row;
  row.uuid = kFirstId;
  row.timestamp = "yesterday";
  insertRawRow(*db_, row);

  auto id = AttachmentId::fromString(kFirstId);
  ASSERT_OK(id);
  EXPECT_ERROR(store_->getMetadata(*id), ErrorCode::kDecodeError);
}

TEST_F(SqliteAttachmentStoreTest, RemoveDeletesExactlyOneRow) {
  insertScenario();
  ASSERT_EQ(attachmentRowCount(), 3);

  auto id = AttachmentId::fromString(kSecondId);
  ASSERT_OK(id);
  ASSERT_OK(store_->remove(*id));

  EXPECT_EQ(attachmentRowCount(), 2);
  EXPECT_ERROR(store_->get(*id), ErrorCode::kNotFound);
  EXPECT_OK(store_->resolve("65f6930f"));
  EXPECT_OK(store_->resolve("412f7ca8"));
}

TEST_F(SqliteAttachmentStoreTest, RemoveNonexistentLeavesStoreUnchanged) {
  insertScenario();

  auto id = AttachmentId::fromString("00000000-1111-2222-3333-444444444444");
  ASSERT_OK(id);
  EXPECT_ERROR(store_->remove(*id), ErrorCode::kNotFound);
  EXPECT_EQ(attachmentRowCount(), 3);
}

TEST_F(SqliteAttachmentStoreTest, RemoveDuplicateIsAmbiguousAndLeavesStoreUnchanged) {
  RawAttachmentRow row;
  row.uuid = kFirstId;
  insertRawRow(*db_, row);
  insertRawRow(*db_, row);
  ASSERT_EQ(attachmentRowCount(), 2);

  auto id = AttachmentId::fromString(kFirstId);
  ASSERT_OK(id);
  EXPECT_ERROR(store_->remove(*id), ErrorCode::kAmbiguousMatch);
  EXPECT_EQ(attachmentRowCount(), 2);
}

TEST_F(SqliteAttachmentStoreTest, RemoveTwiceFailsSecondTime) {
  insertScenario();

  auto id = AttachmentId::fromString(kFirstId);
  ASSERT_OK(id);
  ASSERT_OK(store_->remove(*id));
  EXPECT_ERROR(store_->remove(*id), ErrorCode::kNotFound);
  EXPECT_EQ(attachmentRowCount(), 2);
}

TEST_F(SqliteAttachmentStoreTest, SearchId) {
  insertScenario();

  auto id = store_->searchId("917e");
  ASSERT_OK(id);
  EXPECT_EQ(id->toString(), kSecondId);

  EXPECT_ERROR(store_->searchId("f"), ErrorCode::kAmbiguousMatch);
  EXPECT_ERROR(store_->searchId("ffffffff"), ErrorCode::kNotFound);
}

TEST_F(SqliteAttachmentStoreTest, ListIds) {
  insertScenario();

  auto ids = store_->listIds();
  ASSERT_OK(ids);
  ASSERT_EQ(ids->size(), 3u);

  std::vector<std::string> texts;
  for (const auto& id : *ids) {
    texts.push_back(id.toString());
  }
  std::sort(texts.begin(), texts.end());
  EXPECT_EQ(texts, (std::vector<std::string>{kThirdId, kFirstId, kSecondId}));
}

TEST_F(SqliteAttachmentStoreTest, ListForSnipIsMetadataOnlyAndSorted) {
  auto snip_id = SnipId::fromString(kSnipId);
  ASSERT_OK(snip_id);

  auto later = makeAttachment(kFirstId, "later", "later.txt");
  auto earlier = makeAttachment(kSecondId, "earlier", "earlier.txt");
  earlier.timestamp = later.timestamp - std::chrono::hours(1);

  auto other = makeAttachment(kThirdId, "other", "other.txt");
  other.parent_id = SnipId::generate();

  ASSERT_OK(store_->insert(later));
  ASSERT_OK(store_->insert(earlier));
  ASSERT_OK(store_->insert(other));

  auto attachments = store_->listForSnip(*snip_id);
  ASSERT_OK(attachments);
  ASSERT_EQ(attachments->size(), 2u);
  EXPECT_EQ((*attachments)[0].name, "earlier.txt");
  EXPECT_EQ((*attachments)[1].name, "later.txt");
  for (const auto& attachment : *attachments) {
    EXPECT_TRUE(attachment.data.empty());
    EXPECT_EQ(attachment.parent_id, *snip_id);
  }
}

TEST_F(SqliteAttachmentStoreTest, Statistics) {
  auto count = store_->totalAttachments();
  ASSERT_OK(count);
  EXPECT_EQ(*count, 0u);

  insertScenario();

  count = store_->totalAttachments();
  ASSERT_OK(count);
  EXPECT_EQ(*count, 3u);

  auto size = store_->totalSize();
  ASSERT_OK(size);
  EXPECT_EQ(*size, std::string("firstsecondthird").size());
}

TEST_F(SqliteAttachmentStoreTest, SubstringPatternEscapesWildcards) {
  EXPECT_EQ(SqliteAttachmentStore::substringPattern("65f6"), "%65f6%");
  EXPECT_EQ(SqliteAttachmentStore::substringPattern("a_b%c\\"), "%a\\_b\\%c\\\\%");
  EXPECT_EQ(SqliteAttachmentStore::substringPattern(""), "%%");
}

class AttachmentFileTest : public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    auto db = Database::open(temp_dir_ / "snip.sqlite3");
    ASSERT_OK(db);
    db_ = std::move(*db);
    ASSERT_OK(db_->createSchema());

    SqliteAttachmentStore::Config config;
    config.max_file_size = 1024;
    store_ = std::make_unique<SqliteAttachmentStore>(*db_, config);
  }

  void TearDown() override {
    store_.reset();
    db_.reset();
    TempDirTest::TearDown();
  }

  std::filesystem::path writeFile(const std::string& name, const std::string& content) {
    auto path = temp_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
  }

  std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  std::unique_ptr<Database> db_;
  std::unique_ptr<SqliteAttachmentStore> store_;
};

TEST_F(AttachmentFileTest, AddFromFileStoresContentAndName) {
  std::string content("binary\x00\xff data", 13);
  auto source = writeFile("diagram.png", content);
  auto snip_id = SnipId::fromString(kSnipId);
  ASSERT_OK(snip_id);

  auto added = store_->addFromFile(*snip_id, source);
  ASSERT_OK(added);
  EXPECT_EQ(added->name, "diagram.png");
  EXPECT_EQ(added->size, content.size());
  EXPECT_EQ(added->parent_id, *snip_id);

  auto fetched = store_->resolve(added->id.toString().substr(0, 8));
  ASSERT_OK(fetched);
  EXPECT_EQ(fetched->data, content);
  EXPECT_EQ(fetched->size, content.size());
}

TEST_F(AttachmentFileTest, AddFromFileErrors) {
  auto snip_id = SnipId::fromString(kSnipId);
  ASSERT_OK(snip_id);

  EXPECT_ERROR(store_->addFromFile(*snip_id, temp_dir_ / "missing.pdf"), ErrorCode::kFileNotFound);
  EXPECT_ERROR(store_->addFromFile(*snip_id, temp_dir_), ErrorCode::kFileNotFound);

  auto big = writeFile("big.bin", std::string(2048, 'x'));
  EXPECT_ERROR(store_->addFromFile(*snip_id, big), ErrorCode::kValidationError);

  auto count = store_->totalAttachments();
  ASSERT_OK(count);
  EXPECT_EQ(*count, 0u);
}

TEST_F(AttachmentFileTest, ExportWritesPayload) {
  std::string content("\x00\x01\x02payload", 10);
  auto attachment = makeAttachment(kFirstId, content, "payload.bin");
  ASSERT_OK(store_->insert(attachment));

  auto fetched = store_->resolve("65f6930f");
  ASSERT_OK(fetched);

  auto target = temp_dir_ / fetched->exportFilename();
  ASSERT_OK(store_->exportTo(*fetched, target));
  EXPECT_EQ(readFile(target), content);
}

TEST_F(AttachmentFileTest, ExportRefusesToOverwrite) {
  auto attachment = makeAttachment(kFirstId, "new content");
  auto target = writeFile("existing.txt", "old content");

  EXPECT_ERROR(store_->exportTo(attachment, target), ErrorCode::kFileExists);
  EXPECT_EQ(readFile(target), "old content");
}

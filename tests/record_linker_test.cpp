#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <stdexcept>
#include "core/exact_duplicate_classifier.hpp"
#include "core/quality_ranker.hpp"
#include "core/record_linker.hpp"
#include "core/similarity_classifier.hpp"
#include "test_base.hpp"

class RecordLinkerTest : public ::testing::Test
{
protected:
    PathKeyExtractor extractor_{PathLayout::FILENAME};

    static ExternalRecord makeExternal(const std::string &id, const std::string &accession, const std::string &inventory)
    {
        ExternalRecord record;
        record.record_id = id;
        record.accession = accession;
        record.inventory = inventory;
        record.code_and_number = RecordKeys::deriveKey(accession, inventory).value();
        return record;
    }

    static const LinkageResult &resultFor(const LinkageReport &report, const std::string &path)
    {
        for (const auto &result : report.results)
            if (result.file_path == path)
                return result;
        throw std::out_of_range("no linkage result for " + path);
    }

    LinkageReport link(const std::vector<ExternalRecord> &external, const std::vector<ImageRecord> &records)
    {
        RecordLinker linker(external, extractor_);
        ExactDuplicateReport exact = ExactDuplicateClassifier::classify(records);
        std::vector<std::vector<SimilarityGroup>> partitions = {SimilarityClassifier::classify(records)};
        return linker.link(records, exact, partitions);
    }
};

TEST_F(RecordLinkerTest, DirectMatchPropagatesToExactDuplicate)
{
    std::vector<ExternalRecord> external = {makeExternal("R1", "ACC123", "45")};
    std::vector<ImageRecord> records = {
        makeRecord("ACC123_INV45.jpg", "sha", "w"),
        makeRecord("scan002.jpg", "sha", "w"),
    };

    LinkageReport report = link(external, records);

    const auto &direct = resultFor(report, "ACC123_INV45.jpg");
    EXPECT_EQ(direct.status, LinkageStatus::DIRECT);
    EXPECT_EQ(direct.record_id.value(), "R1");
    EXPECT_EQ(direct.derived_key.value(), "ACC123\\45");

    const auto &propagated = resultFor(report, "scan002.jpg");
    EXPECT_EQ(propagated.status, LinkageStatus::PROPAGATED);
    EXPECT_EQ(propagated.record_id.value(), "R1");
    ASSERT_TRUE(propagated.via_group.has_value());
    EXPECT_EQ(propagated.via_group->kind, GroupKind::EXACT_DUPLICATE);
    EXPECT_EQ(propagated.via_group->key, "sha:w");

    EXPECT_EQ(report.direct_count, 1u);
    EXPECT_EQ(report.propagated_count, 1u);
    EXPECT_TRUE(report.conflicts.empty());
}

TEST_F(RecordLinkerTest, ConflictingGroupPropagatesNothing)
{
    std::vector<ExternalRecord> external = {
        makeExternal("R1", "ACC1", "1"),
        makeExternal("R2", "ACC2", "2"),
    };
    std::vector<ImageRecord> records = {
        makeRecord("ACC1_INV1.jpg", "sha", "w"),
        makeRecord("ACC2_INV2.jpg", "sha", "w"),
        makeRecord("loose.jpg", "sha", "w"),
    };

    LinkageReport report = link(external, records);

    EXPECT_EQ(resultFor(report, "ACC1_INV1.jpg").record_id.value(), "R1");
    EXPECT_EQ(resultFor(report, "ACC2_INV2.jpg").record_id.value(), "R2");

    const auto &loose = resultFor(report, "loose.jpg");
    EXPECT_EQ(loose.status, LinkageStatus::CONFLICT);
    EXPECT_FALSE(loose.record_id.has_value());

    ASSERT_EQ(report.conflicts.size(), 1u);
    EXPECT_EQ(report.conflicts[0].record_ids, (std::vector<std::string>{"R1", "R2"}));
    EXPECT_EQ(report.conflicts[0].file_paths.size(), 3u);
    EXPECT_EQ(report.conflict_count, 1u);
}

TEST_F(RecordLinkerTest, UnmatchedImagesStayUnlinked)
{
    std::vector<ExternalRecord> external = {makeExternal("R1", "ACC1", "1")};
    std::vector<ImageRecord> records = {
        makeRecord("ACC9_INV9.jpg", "s1", "w1"),
        makeRecord("other.jpg", "s2", "w2"),
    };

    LinkageReport report = link(external, records);

    const auto &unknown_key = resultFor(report, "ACC9_INV9.jpg");
    EXPECT_EQ(unknown_key.status, LinkageStatus::UNLINKED);
    EXPECT_EQ(unknown_key.derived_key.value(), "ACC9\\9");
    EXPECT_FALSE(unknown_key.record_id.has_value());
    EXPECT_EQ(resultFor(report, "other.jpg").status, LinkageStatus::UNLINKED);
    EXPECT_EQ(report.unlinked_count, 2u);
}

TEST_F(RecordLinkerTest, ExactGroupTakesPrecedenceOverSimilarity)
{
    std::vector<ExternalRecord> external = {
        makeExternal("R1", "ACC1", "1"),
        makeExternal("R2", "ACC2", "2"),
    };
    // target is an exact duplicate of the R1 image and only similar to the R2 image
    std::vector<ImageRecord> records = {
        makeRecord("ACC1_INV1.jpg", "sha", "w", std::string("p1")),
        makeRecord("target.jpg", "sha", "w", std::string("p2")),
        makeRecord("ACC2_INV2.jpg", "other", "w2", std::string("p2")),
    };

    LinkageReport report = link(external, records);

    const auto &target = resultFor(report, "target.jpg");
    EXPECT_EQ(target.status, LinkageStatus::PROPAGATED);
    EXPECT_EQ(target.record_id.value(), "R1");
    EXPECT_EQ(target.via_group->kind, GroupKind::EXACT_DUPLICATE);
}

TEST_F(RecordLinkerTest, SimilarityGroupDecidesWhenExactGroupHasNoLink)
{
    std::vector<ExternalRecord> external = {makeExternal("R2", "ACC2", "2")};
    std::vector<ImageRecord> records = {
        makeRecord("copy_a.jpg", "sha", "w", std::string("p1")),
        makeRecord("copy_b.jpg", "sha", "w", std::string("p9")),
        makeRecord("ACC2_INV2.jpg", "other", "w2", std::string("p1")),
    };

    LinkageReport report = link(external, records);

    const auto &copy_a = resultFor(report, "copy_a.jpg");
    EXPECT_EQ(copy_a.status, LinkageStatus::PROPAGATED);
    EXPECT_EQ(copy_a.record_id.value(), "R2");
    EXPECT_EQ(copy_a.via_group->kind, GroupKind::SIMILAR_PERCEPTUAL);

    // No chaining through copy_a into its exact group
    EXPECT_EQ(resultFor(report, "copy_b.jpg").status, LinkageStatus::UNLINKED);
}

TEST_F(RecordLinkerTest, UnlinkedMarkerBlocksDirectLinkButAllowsPropagation)
{
    std::vector<ExternalRecord> external = {makeExternal("R1", "ACC1", "1")};
    std::vector<ImageRecord> records = {
        makeRecord("ACC1_INV1.jpg", "sha", "w"),
        makeRecord("ACC1_INV1_OGK.jpg", "sha", "w"),
    };

    LinkageReport report = link(external, records);

    const auto &marked = resultFor(report, "ACC1_INV1_OGK.jpg");
    EXPECT_FALSE(marked.derived_key.has_value());
    EXPECT_EQ(marked.status, LinkageStatus::PROPAGATED);
}

TEST_F(RecordLinkerTest, SharedExternalKeyIsNotResolved)
{
    std::vector<ExternalRecord> external = {
        makeExternal("10", "ACC1", "1"),
        makeExternal("9", "ACC1", "001"),
        makeExternal("9", "ACC1", "1"),
        makeExternal("R2", "ACC2", "2"),
    };
    RecordLinker linker(external, extractor_);

    EXPECT_EQ(linker.lookupRecordId("ACC1\\1"), "");
    EXPECT_EQ(linker.lookupRecordIds("ACC1\\1"), (std::vector<std::string>{"9", "10"}));
    EXPECT_EQ(linker.lookupRecordId("ACC2\\2"), "R2");
    EXPECT_EQ(linker.ambiguousKeyCount(), 1u);
    EXPECT_EQ(linker.lookupRecordId("ACC3\\1"), "");
}

TEST_F(RecordLinkerTest, ImageWithSharedKeyIsConflictAndPropagatesNothing)
{
    std::vector<ExternalRecord> external = {
        makeExternal("10", "ACC1", "1"),
        makeExternal("9", "ACC1", "1"),
    };
    std::vector<ImageRecord> records = {
        makeRecord("ACC1_INV1.jpg", "sha", "w"),
        makeRecord("copy.jpg", "sha", "w"),
    };

    LinkageReport report = link(external, records);

    const auto &keyed = resultFor(report, "ACC1_INV1.jpg");
    EXPECT_EQ(keyed.status, LinkageStatus::CONFLICT);
    EXPECT_FALSE(keyed.record_id.has_value());
    EXPECT_EQ(keyed.derived_key.value(), "ACC1\\1");
    EXPECT_FALSE(keyed.via_group.has_value());

    EXPECT_EQ(resultFor(report, "copy.jpg").status, LinkageStatus::UNLINKED);
    EXPECT_EQ(report.direct_count, 0u);
    EXPECT_EQ(report.conflict_count, 1u);
    EXPECT_TRUE(report.conflicts.empty());

    ASSERT_EQ(report.ambiguous_keys.size(), 1u);
    EXPECT_EQ(report.ambiguous_keys[0].code_and_number, "ACC1\\1");
    EXPECT_EQ(report.ambiguous_keys[0].record_ids, (std::vector<std::string>{"9", "10"}));
    EXPECT_EQ(report.ambiguous_keys[0].file_paths, (std::vector<std::string>{"ACC1_INV1.jpg"}));
}

TEST_F(RecordLinkerTest, OneResultPerDistinctImage)
{
    std::vector<ImageRecord> records = {
        makeRecord("b.jpg", "s1", "w1"),
        makeRecord("a.jpg", "s2", "w2"),
        makeRecord("b.jpg", "s1", "w1"),
    };

    LinkageReport report = link({}, records);

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].file_path, "a.jpg");
    EXPECT_EQ(report.results[1].file_path, "b.jpg");
}

// Linkage and ranking flattened to comparable lines
static std::vector<std::string> describeRun(const std::vector<ExternalRecord> &external,
                                            const std::vector<ImageRecord> &records,
                                            const PathKeyExtractor &extractor)
{
    ExactDuplicateReport exact = ExactDuplicateClassifier::classify(records);
    std::vector<SimilarityGroup> similar = SimilarityClassifier::classify(records);
    LinkageReport linkage = RecordLinker(external, extractor).link(records, exact, {similar});

    RecordIndex index = QualityRanker::buildIndex(records);
    std::vector<GroupRanking> rankings = QualityRanker::rankDuplicateGroups(exact.groups, index);
    for (auto &ranking : QualityRanker::rankSimilarityGroups(similar, index))
        rankings.push_back(std::move(ranking));

    std::vector<std::string> lines;
    for (const auto &result : linkage.results)
        lines.push_back(result.file_path + "|" + LinkageStatuses::getStatusName(result.status) + "|" +
                        result.record_id.value_or("-"));
    for (const auto &ranking : rankings)
        for (const auto &member : ranking.members)
            lines.push_back(ranking.group.key + "|" + member.file_path + "|" + std::to_string(member.rank) +
                            (ranking.ambiguous_best ? "|tied" : ""));
    return lines;
}

TEST_F(RecordLinkerTest, ResultsDoNotDependOnInputOrder)
{
    std::vector<ExternalRecord> external = {
        makeExternal("R1", "ACC1", "1"),
        makeExternal("R2", "ACC2", "2"),
        makeExternal("R3", "ACC3", "3"),
    };
    std::vector<ImageRecord> records = {
        makeRecord("ACC1_INV1.jpg", "sha1", "w1", std::string("p1"), 1024, 768, 100),
        makeRecord("scan002.jpg", "sha1", "w1", std::string("p1"), 800, 600, 100),
        makeRecord("ACC2_INV2.jpg", "s2", "w2", std::string("p2"), 640, 480, 10),
        makeRecord("ACC3_INV3.jpg", "s3", "w3", std::string("p2"), 640, 480, 10),
        makeRecord("loose.jpg", "s4", "w4", std::string("p2"), 320, 240, 10),
        makeRecord("lone.jpg", "s5", "w5", std::string("p9"), 100, 100, 5),
    };

    std::vector<std::string> expected = describeRun(external, records, extractor_);
    EXPECT_NE(std::find(expected.begin(), expected.end(), "scan002.jpg|propagated|R1"), expected.end());
    EXPECT_NE(std::find(expected.begin(), expected.end(), "loose.jpg|conflict|-"), expected.end());
    EXPECT_NE(std::find(expected.begin(), expected.end(), "lone.jpg|unlinked|-"), expected.end());
    EXPECT_NE(std::find(expected.begin(), expected.end(), "p2|loose.jpg|2|tied"), expected.end());

    std::mt19937 rng(7);
    for (int round = 0; round < 50; ++round)
    {
        std::shuffle(records.begin(), records.end(), rng);
        std::shuffle(external.begin(), external.end(), rng);
        ASSERT_EQ(describeRun(external, records, extractor_), expected) << "round " << round;
    }
}

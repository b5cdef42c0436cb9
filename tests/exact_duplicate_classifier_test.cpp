#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include "core/exact_duplicate_classifier.hpp"
#include "test_base.hpp"

class ExactDuplicateClassifierTest : public ::testing::Test
{
protected:
    static const CollisionMember *findMember(const CollisionCandidateGroup &group, const std::string &path)
    {
        for (const auto &member : group.members)
            if (member.file_path == path)
                return &member;
        return nullptr;
    }
};

TEST_F(ExactDuplicateClassifierTest, IdenticalFilesFormOneGroup)
{
    std::vector<ImageRecord> records = {
        makeRecord("c.jpg", "sha1", "w1"),
        makeRecord("a.jpg", "sha1", "w1"),
        makeRecord("b.jpg", "sha1", "w1"),
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].content_digest, "sha1");
    EXPECT_EQ(report.groups[0].weak_digest, "w1");
    EXPECT_EQ(report.groups[0].file_paths, (std::vector<std::string>{"a.jpg", "b.jpg", "c.jpg"}));
    EXPECT_EQ(report.groups[0].key(), "sha1:w1");
    EXPECT_TRUE(report.weak_collisions.empty());
    EXPECT_TRUE(report.strong_collisions.empty());
}

TEST_F(ExactDuplicateClassifierTest, WeakDigestAgreementAloneIsACollision)
{
    std::vector<ImageRecord> records = {
        makeRecord("a.jpg", "sha1", "w1"),
        makeRecord("b.jpg", "sha2", "w1"),
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    EXPECT_TRUE(report.groups.empty());
    ASSERT_EQ(report.weak_collisions.size(), 1u);
    const auto &collision = report.weak_collisions[0];
    EXPECT_EQ(collision.kind, CollisionKind::WEAK);
    EXPECT_EQ(collision.shared_digest, "w1");
    ASSERT_EQ(collision.members.size(), 2u);
    EXPECT_EQ(collision.members[0].file_path, "a.jpg");
    EXPECT_EQ(collision.members[0].other_digest, "sha1");
    EXPECT_TRUE(collision.members[0].unique_in_group);
    EXPECT_TRUE(report.strong_collisions.empty());
}

TEST_F(ExactDuplicateClassifierTest, ContentAgreementAloneIsAStrongCollision)
{
    std::vector<ImageRecord> records = {
        makeRecord("a.jpg", "sha1", "w1"),
        makeRecord("b.jpg", "sha1", "w2"),
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    EXPECT_TRUE(report.groups.empty());
    EXPECT_TRUE(report.weak_collisions.empty());
    ASSERT_EQ(report.strong_collisions.size(), 1u);
    EXPECT_EQ(report.strong_collisions[0].kind, CollisionKind::STRONG);
    EXPECT_EQ(report.strong_collisions[0].shared_digest, "sha1");
}

TEST_F(ExactDuplicateClassifierTest, MixedWeakGroupReportsEveryMember)
{
    // A and B are true duplicates, C and D only share the weak digest
    std::vector<ImageRecord> records = {
        makeRecord("A.jpg", "x", "w"),
        makeRecord("B.jpg", "x", "w"),
        makeRecord("C.jpg", "y", "w"),
        makeRecord("D.jpg", "z", "w"),
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].file_paths, (std::vector<std::string>{"A.jpg", "B.jpg"}));

    ASSERT_EQ(report.weak_collisions.size(), 1u);
    const auto &collision = report.weak_collisions[0];
    ASSERT_EQ(collision.members.size(), 4u);
    EXPECT_FALSE(findMember(collision, "A.jpg")->unique_in_group);
    EXPECT_FALSE(findMember(collision, "B.jpg")->unique_in_group);
    EXPECT_TRUE(findMember(collision, "C.jpg")->unique_in_group);
    EXPECT_TRUE(findMember(collision, "D.jpg")->unique_in_group);
}

TEST_F(ExactDuplicateClassifierTest, RecordsMissingADigestAreUnhashed)
{
    ImageRecord no_weak;
    no_weak.file_path = "no_weak.jpg";
    no_weak.content_digest = "sha1";

    ImageRecord unread;
    unread.file_path = "unread.jpg";

    std::vector<ImageRecord> records = {
        makeRecord("a.jpg", "sha1", "w1"),
        unread,
        no_weak,
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    EXPECT_TRUE(report.groups.empty());
    EXPECT_TRUE(report.strong_collisions.empty());
    EXPECT_EQ(report.unhashed, (std::vector<std::string>{"no_weak.jpg", "unread.jpg"}));
}

TEST_F(ExactDuplicateClassifierTest, SingletonsProduceNothing)
{
    std::vector<ImageRecord> records = {
        makeRecord("a.jpg", "sha1", "w1"),
        makeRecord("b.jpg", "sha2", "w2"),
    };

    ExactDuplicateReport report = ExactDuplicateClassifier::classify(records);

    EXPECT_TRUE(report.groups.empty());
    EXPECT_TRUE(report.weak_collisions.empty());
    EXPECT_TRUE(report.strong_collisions.empty());
    EXPECT_TRUE(report.unhashed.empty());
}

TEST_F(ExactDuplicateClassifierTest, GroupsAgreeOnBothDigestsAndIgnoreInputOrder)
{
    std::vector<ImageRecord> records;
    for (int i = 0; i < 40; ++i)
    {
        std::string content = "c" + std::to_string(i % 5);
        std::string weak = "w" + std::to_string(i % 3);
        records.push_back(makeRecord("img" + std::to_string(i) + ".jpg", content, weak));
    }

    ExactDuplicateReport first = ExactDuplicateClassifier::classify(records);

    for (const auto &group : first.groups)
    {
        ASSERT_GE(group.file_paths.size(), 2u);
        for (const auto &path : group.file_paths)
        {
            auto it = std::find_if(records.begin(), records.end(), [&path](const ImageRecord &r)
                                   { return r.file_path == path; });
            ASSERT_NE(it, records.end());
            EXPECT_EQ(*it->content_digest, group.content_digest);
            EXPECT_EQ(*it->weak_digest, group.weak_digest);
        }
    }

    std::mt19937 rng(42);
    std::shuffle(records.begin(), records.end(), rng);
    ExactDuplicateReport second = ExactDuplicateClassifier::classify(records);

    ASSERT_EQ(first.groups.size(), second.groups.size());
    for (size_t i = 0; i < first.groups.size(); ++i)
    {
        EXPECT_EQ(first.groups[i].key(), second.groups[i].key());
        EXPECT_EQ(first.groups[i].file_paths, second.groups[i].file_paths);
    }
    EXPECT_EQ(first.weak_collisions.size(), second.weak_collisions.size());
    EXPECT_EQ(first.strong_collisions.size(), second.strong_collisions.size());
}

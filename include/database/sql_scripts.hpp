#pragma once

namespace DatabaseScripts
{
    // Tables written by every analysis run
    constexpr const char *CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS image_records (
            file_path TEXT PRIMARY KEY,
            content_digest TEXT,
            weak_digest TEXT,
            average_hash TEXT,
            perceptual_hash TEXT,
            x_resolution INTEGER,
            y_resolution INTEGER,
            num_unique_colors INTEGER,
            file_size INTEGER,
            error_message TEXT
        );

        CREATE TABLE IF NOT EXISTS external_records (
            record_id TEXT NOT NULL,
            accession TEXT NOT NULL,
            inventory TEXT NOT NULL,
            suffix TEXT,
            code_and_number TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS exact_duplicates (
            group_key TEXT NOT NULL,
            content_digest TEXT NOT NULL,
            weak_digest TEXT NOT NULL,
            file_path TEXT NOT NULL,
            PRIMARY KEY (group_key, file_path)
        );

        CREATE TABLE IF NOT EXISTS collision_candidates (
            collision_kind TEXT NOT NULL,
            shared_digest TEXT NOT NULL,
            file_path TEXT NOT NULL,
            other_digest TEXT NOT NULL,
            unique_in_group INTEGER NOT NULL,
            PRIMARY KEY (collision_kind, shared_digest, file_path)
        );

        CREATE TABLE IF NOT EXISTS similar_images (
            hash_type TEXT NOT NULL,
            hash_value TEXT NOT NULL,
            file_path TEXT NOT NULL,
            PRIMARY KEY (hash_type, hash_value, file_path)
        );

        CREATE TABLE IF NOT EXISTS ranked_members (
            group_kind TEXT NOT NULL,
            group_key TEXT NOT NULL,
            file_path TEXT NOT NULL,
            rank INTEGER NOT NULL,
            x_resolution INTEGER,
            y_resolution INTEGER,
            num_unique_colors INTEGER,
            removal_candidate INTEGER NOT NULL,
            ambiguous_best INTEGER NOT NULL,
            PRIMARY KEY (group_kind, group_key, file_path)
        );

        CREATE TABLE IF NOT EXISTS linkage_results (
            file_path TEXT PRIMARY KEY,
            record_id TEXT,
            status TEXT NOT NULL,
            derived_key TEXT,
            via_group_kind TEXT,
            via_group_key TEXT
        );

        CREATE TABLE IF NOT EXISTS linkage_conflicts (
            group_kind TEXT NOT NULL,
            group_key TEXT NOT NULL,
            record_id TEXT NOT NULL,
            PRIMARY KEY (group_kind, group_key, record_id)
        );

        CREATE TABLE IF NOT EXISTS ambiguous_record_keys (
            code_and_number TEXT NOT NULL,
            record_id TEXT NOT NULL,
            PRIMARY KEY (code_and_number, record_id)
        );

        CREATE TABLE IF NOT EXISTS unhashed_files (
            file_path TEXT PRIMARY KEY,
            error_message TEXT
        );
    )";

    constexpr const char *CREATE_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_external_records_key ON external_records(code_and_number);
        CREATE INDEX IF NOT EXISTS idx_external_records_id ON external_records(record_id);
        CREATE INDEX IF NOT EXISTS idx_exact_duplicates_path ON exact_duplicates(file_path);
        CREATE INDEX IF NOT EXISTS idx_similar_images_path ON similar_images(file_path);
        CREATE INDEX IF NOT EXISTS idx_linkage_results_record ON linkage_results(record_id);
    )";

    // Views are recreated on open so an existing database picks up the current definitions
    constexpr const char *CREATE_VIEWS = R"(
        DROP VIEW IF EXISTS exact_duplicates_linked;
        DROP VIEW IF EXISTS removal_candidates;
        DROP VIEW IF EXISTS ambiguous_best;
        DROP VIEW IF EXISTS conflicted_images;

        -- One external row per record id: the first one in export order
        CREATE VIEW exact_duplicates_linked AS
            SELECT d.group_key, d.file_path, l.record_id, l.status,
                   e.accession, e.inventory, e.suffix
            FROM exact_duplicates d
            LEFT JOIN linkage_results l ON l.file_path = d.file_path
            LEFT JOIN external_records e ON e.rowid = (
                SELECT MIN(x.rowid) FROM external_records x WHERE x.record_id = l.record_id);

        CREATE VIEW removal_candidates AS
            SELECT group_kind, group_key, file_path, rank
            FROM ranked_members
            WHERE removal_candidate = 1;

        CREATE VIEW ambiguous_best AS
            SELECT group_kind, group_key, file_path
            FROM ranked_members
            WHERE ambiguous_best = 1 AND rank = 1;

        CREATE VIEW conflicted_images AS
            SELECT r.group_kind, r.group_key, r.file_path, l.status, l.record_id
            FROM (SELECT DISTINCT group_kind, group_key FROM linkage_conflicts) c
            JOIN ranked_members r ON r.group_kind = c.group_kind AND r.group_key = c.group_key
            LEFT JOIN linkage_results l ON l.file_path = r.file_path;
    )";

    // Derived tables, cleared at the start of every run
    constexpr const char *DERIVED_TABLES[] = {
        "image_records",
        "external_records",
        "exact_duplicates",
        "collision_candidates",
        "similar_images",
        "ranked_members",
        "linkage_results",
        "linkage_conflicts",
        "ambiguous_record_keys",
        "unhashed_files",
    };
}

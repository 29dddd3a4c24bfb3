#include "CSVUtils.h"
#include "DatasetLoader.h"
#include "UmbraExceptions.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {
std::string writeTemp(const std::string& name, const std::string& content) {
    const std::string path = std::string(UMBRA_TEST_DATA_DIR) + "/" + name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}
} // namespace

TEST_CASE("csv tokenizer handles quotes, escapes and multiline fields", "[loader]") {
    std::istringstream in("a, \"b,c\",\"say \"\"hi\"\"\"\n\"line1\nline2\",x\r\n\n");
    const auto first = CSVUtils::parseCSVLine(in, ',');
    REQUIRE(first == std::vector<std::string>{"a", "b,c", "say \"hi\""});
    const auto second = CSVUtils::parseCSVLine(in, ',');
    REQUIRE(second == std::vector<std::string>{"line1\nline2", "x"});
    REQUIRE(CSVUtils::parseCSVLine(in, ',').empty());

    bool malformed = false;
    std::istringstream broken("\"open,field\n");
    CSVUtils::parseCSVLine(broken, ',', &malformed);
    REQUIRE(malformed);
}

TEST_CASE("header names are made unique", "[loader]") {
    const auto header = CSVUtils::normalizeHeader({"age", "", "age", "age"});
    REQUIRE(header == std::vector<std::string>{"age", "column_2", "age_2", "age_3"});
}

TEST_CASE("fields that need it are quoted on output", "[loader]") {
    REQUIRE(CSVUtils::quoteField("plain", ',') == "plain");
    REQUIRE(CSVUtils::quoteField("a,b", ',') == "\"a,b\"");
    REQUIRE(CSVUtils::quoteField("say \"hi\"", ',') == "\"say \"\"hi\"\"\"");
    REQUIRE(CSVUtils::quoteField("a,b", ';') == "a,b");
}

TEST_CASE("loader infers column types and missing values", "[loader]") {
    const std::string path = writeTemp("loader_types.csv",
                                       "\xEF\xBB\xBFname,age,admitted,zip,diagnosis\n"
                                       "Ann,34,2021-03-15,13053,flu\n"
                                       "Bob,NA,2021-04-01,13068,\"cold, severe\"\n"
                                       "Cy,51,,02139,null\n");
    const PrivacyDataset data = DatasetLoader::load(path, ',',
                                                    {{"name", AttributeRole::IDENTIFIER},
                                                     {"age", AttributeRole::QUASI_IDENTIFIER},
                                                     {"diagnosis", AttributeRole::SENSITIVE}},
                                                    {{"zip", ColumnType::CATEGORICAL}});
    REQUIRE(data.rowCount() == 3);
    REQUIRE(data.column("name").type == ColumnType::CATEGORICAL);
    REQUIRE(data.column("age").type == ColumnType::NUMERIC);
    REQUIRE(data.column("admitted").type == ColumnType::DATETIME);
    REQUIRE(data.column("zip").type == ColumnType::CATEGORICAL);
    REQUIRE(data.cellText(2, data.requireColumnIndex("zip")) == "02139");
    REQUIRE(data.column("name").role == AttributeRole::IDENTIFIER);
    REQUIRE(data.column("admitted").role == AttributeRole::INSENSITIVE);

    REQUIRE(data.isMissing(1, data.requireColumnIndex("age")));
    REQUIRE(data.isMissing(2, data.requireColumnIndex("admitted")));
    REQUIRE(data.isMissing(2, data.requireColumnIndex("diagnosis")));
    REQUIRE(data.cellText(1, data.requireColumnIndex("diagnosis")) == "cold, severe");
    REQUIRE(data.cellText(0, data.requireColumnIndex("admitted")) == "2021-03-15");
    std::remove(path.c_str());
}

TEST_CASE("short records are padded with missing cells", "[loader]") {
    const std::string path = writeTemp("loader_short.csv", "a,b,c\n1,2,3\n4,5\n");
    const PrivacyDataset data = DatasetLoader::load(path);
    REQUIRE(data.rowCount() == 2);
    REQUIRE(data.isMissing(1, 2));
    REQUIRE(data.column("c").type == ColumnType::NUMERIC);
    std::remove(path.c_str());
}

TEST_CASE("loader rejects malformed input", "[loader]") {
    REQUIRE_THROWS_AS(DatasetLoader::load(std::string(UMBRA_TEST_DATA_DIR) + "/does_not_exist.csv"), Umbra::IOException);

    const std::string wide = writeTemp("loader_wide.csv", "a,b\n1,2,3\n");
    REQUIRE_THROWS_AS(DatasetLoader::load(wide), Umbra::DatasetException);
    std::remove(wide.c_str());

    const std::string empty = writeTemp("loader_empty.csv", "a,b\n");
    REQUIRE_THROWS_AS(DatasetLoader::load(empty), Umbra::DatasetException);
    std::remove(empty.c_str());

    const std::string typed = writeTemp("loader_typed.csv", "a,b\n1,x\n2,y\n");
    REQUIRE_THROWS_AS(DatasetLoader::load(typed, ',', {}, {{"b", ColumnType::NUMERIC}}), Umbra::DatasetException);
    REQUIRE_THROWS_AS(DatasetLoader::load(typed, ',', {{"c", AttributeRole::SENSITIVE}}), Umbra::ConfigurationException);
    std::remove(typed.c_str());
}

TEST_CASE("saved datasets load back with the same cells", "[loader]") {
    const PrivacyDataset data({makeCategoricalColumn("city", {"Oslo", "Bergen, West", "say \"hi\""}),
                               makeNumericColumn("age", {34.5, 40, 51})});
    const std::string path = std::string(UMBRA_TEST_DATA_DIR) + "/loader_saved.csv";
    DatasetLoader::save(data, path, ';');
    const PrivacyDataset loaded = DatasetLoader::load(path, ';');
    REQUIRE(loaded.rowCount() == 3);
    for (size_t r = 0; r < 3; ++r) {
        REQUIRE(loaded.cellText(r, 0) == data.cellText(r, 0));
        REQUIRE(loaded.cellText(r, 1) == data.cellText(r, 1));
    }
    std::remove(path.c_str());
}

TEST_CASE("missing tokens are recognised case-insensitively", "[loader]") {
    REQUIRE(DatasetLoader::isMissingToken(""));
    REQUIRE(DatasetLoader::isMissingToken(" N/A "));
    REQUIRE(DatasetLoader::isMissingToken("NULL"));
    REQUIRE_FALSE(DatasetLoader::isMissingToken("0"));
    REQUIRE_FALSE(DatasetLoader::isMissingToken("nano"));
}

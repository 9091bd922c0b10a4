#include "DataLoader.h"
#include "Errors.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string error_of(const std::function<void()>& f) {
    try {
        f();
    } catch (const ValidationError& e) {
        return e.what();
    }
    return std::string();
}

class DataDirectory {
public:
    DataDirectory() {
        dir = fs::temp_directory_path() /
              ("marketsim_loader_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }
    ~DataDirectory() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(dir / name);
        out << content;
    }
    std::string path() const { return dir.string(); }

private:
    fs::path dir;
};

const char* POSTAL_CODES =
    "postal_code,market,latitude,longitude,str_tam,area\n"
    "10001,nyc,40.7506,-73.9972,120.5,1.6\n"
    "10002,nyc,40.7157,-73.9863,80,\n"
    "94103,sf,37.7725,-122.4091,60,3.7\n";

} // namespace

TEST(DataLoaderTest, SplitLineHonoursQuotes) {
    std::vector<std::string> f = DataLoader::split_line("a,\"b,c\",\"say \"\"hi\"\"\",\r");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "say \"hi\"");
    EXPECT_EQ(f[3], "");
}

TEST(DataLoaderTest, ParseBool) {
    bool v = false;
    EXPECT_TRUE(DataLoader::parse_bool("TRUE", v));
    EXPECT_TRUE(v);
    EXPECT_TRUE(DataLoader::parse_bool(" no ", v));
    EXPECT_FALSE(v);
    EXPECT_TRUE(DataLoader::parse_bool("1", v));
    EXPECT_TRUE(v);
    EXPECT_FALSE(DataLoader::parse_bool("maybe", v));
    EXPECT_FALSE(DataLoader::parse_bool("", v));
}

TEST(DataLoaderTest, LoadsPostalCodes) {
    std::istringstream in(POSTAL_CODES);
    std::vector<PostalCell> cells = DataLoader().load_postal_codes(in, "mem");
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0].postal_code, "10001");
    EXPECT_EQ(cells[0].market, "nyc");
    EXPECT_DOUBLE_EQ(cells[0].centroid.latitude, 40.7506);
    EXPECT_DOUBLE_EQ(cells[0].str_tam, 120.5);
    ASSERT_TRUE(cells[0].area_km2.has_value());
    EXPECT_DOUBLE_EQ(*cells[0].area_km2, 1.6);
    EXPECT_FALSE(cells[1].area_km2.has_value());
}

TEST(DataLoaderTest, ColumnOrderDoesNotMatter) {
    std::istringstream in(
        "str_tam,longitude,postal_code,latitude,market\n"
        "\n"
        "5,-73.99,10001,40.75,nyc\n");
    std::vector<PostalCell> cells = DataLoader().load_postal_codes(in, "mem");
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_DOUBLE_EQ(cells[0].centroid.longitude, -73.99);
    EXPECT_DOUBLE_EQ(cells[0].str_tam, 5.0);
}

TEST(DataLoaderTest, MissingColumnIsReported) {
    std::string msg = error_of([] {
        std::istringstream in("postal_code,market,latitude,longitude\n10001,nyc,40.75,-73.99\n");
        DataLoader().load_postal_codes(in, "mem");
    });
    EXPECT_NE(msg.find("missing column str_tam"), std::string::npos) << msg;
}

TEST(DataLoaderTest, BadNumberNamesTheLine) {
    std::string msg = error_of([] {
        std::istringstream in(
            "postal_code,market,latitude,longitude,str_tam\n"
            "10001,nyc,40.75,-73.99,5\n"
            "10002,nyc,abc,-73.99,5\n");
        DataLoader().load_postal_codes(in, "mem");
    });
    EXPECT_NE(msg.find("mem:3"), std::string::npos) << msg;
    EXPECT_NE(msg.find("latitude"), std::string::npos) << msg;
}

TEST(DataLoaderTest, InvalidCellIsRejected) {
    std::istringstream in(
        "postal_code,market,latitude,longitude,str_tam\n"
        "10001,nyc,40.75,-73.99,-5\n");
    EXPECT_THROW(DataLoader().load_postal_codes(in, "mem"), ValidationError);
}

TEST(DataLoaderTest, EmptyInputHasNoHeader) {
    std::istringstream in("");
    EXPECT_THROW(DataLoader().load_cleaners(in, "mem"), ValidationError);
}

TEST(DataLoaderTest, LoadsCleanersWithDefaults) {
    std::istringstream in(
        "contractor_id,latitude,longitude\n"
        "c1,40.75,-73.99\n");
    std::vector<Cleaner> cleaners = DataLoader().load_cleaners(in, "mem");
    ASSERT_EQ(cleaners.size(), 1u);
    EXPECT_EQ(cleaners[0].contractor_id, "c1");
    EXPECT_TRUE(cleaners[0].bidding_active);
    EXPECT_DOUBLE_EQ(cleaners[0].cleaner_score, 0.5);
    EXPECT_DOUBLE_EQ(cleaners[0].service_radius, 10.0);
    EXPECT_EQ(cleaners[0].team_size, 1);
    EXPECT_EQ(cleaners[0].active_connections, 0);
    EXPECT_TRUE(cleaners[0].postal_code.empty());
}

TEST(DataLoaderTest, LoadsAllCleanerColumns) {
    std::istringstream in(
        "contractor_id,postal_code,latitude,longitude,bidding_active,assignment_active,"
        "cleaner_score,service_radius,team_size,active_connections\n"
        "c1,10001,40.75,-73.99,yes,0,0.9,4.5,3,7\n"
        "c2,10002,40.71,-73.98,false,true,0.2,2,1,0\n");
    std::vector<Cleaner> cleaners = DataLoader().load_cleaners(in, "mem");
    ASSERT_EQ(cleaners.size(), 2u);
    EXPECT_EQ(cleaners[0].postal_code, "10001");
    EXPECT_TRUE(cleaners[0].bidding_active);
    EXPECT_FALSE(cleaners[0].assignment_active);
    EXPECT_DOUBLE_EQ(cleaners[0].cleaner_score, 0.9);
    EXPECT_DOUBLE_EQ(cleaners[0].service_radius, 4.5);
    EXPECT_EQ(cleaners[0].team_size, 3);
    EXPECT_EQ(cleaners[0].active_connections, 7);
    EXPECT_FALSE(cleaners[1].bidding_active);
}

TEST(DataLoaderTest, InvalidCleanerNamesTheLine) {
    std::string msg = error_of([] {
        std::istringstream in(
            "contractor_id,latitude,longitude,cleaner_score\n"
            "c1,40.75,-73.99,2.0\n");
        DataLoader().load_cleaners(in, "cleaners.csv");
    });
    EXPECT_NE(msg.find("cleaners.csv:2"), std::string::npos) << msg;
    EXPECT_NE(msg.find("cleaner_score"), std::string::npos) << msg;
}

TEST(DataLoaderTest, TeamSizeBeyondIntIsRejected) {
    std::string msg = error_of([] {
        std::istringstream in(
            "contractor_id,latitude,longitude,team_size\n"
            "c1,40.75,-73.99,4294967297\n");
        DataLoader().load_cleaners(in, "mem");
    });
    EXPECT_NE(msg.find("mem:2"), std::string::npos) << msg;
    EXPECT_NE(msg.find("team_size"), std::string::npos) << msg;
    EXPECT_NE(msg.find("4294967297"), std::string::npos) << msg;

    msg = error_of([] {
        std::istringstream in(
            "contractor_id,latitude,longitude,active_connections\n"
            "c1,40.75,-73.99,5\n"
            "c2,40.75,-73.99,-9999999999\n");
        DataLoader().load_cleaners(in, "mem");
    });
    EXPECT_NE(msg.find("mem:3"), std::string::npos) << msg;
    EXPECT_NE(msg.find("active_connections"), std::string::npos) << msg;
}

TEST(DataLoaderTest, LargestTeamSizeLoads) {
    std::istringstream in(
        "contractor_id,latitude,longitude,team_size\n"
        "c1,40.75,-73.99,2147483647\n");
    std::vector<Cleaner> cleaners = DataLoader().load_cleaners(in, "mem");
    ASSERT_EQ(cleaners.size(), 1u);
    EXPECT_EQ(cleaners[0].team_size, 2147483647);
    EXPECT_DOUBLE_EQ(cleaners[0].utilization(10), 0.0);
}

TEST(DataLoaderTest, BadBooleanIsReported) {
    std::istringstream in(
        "contractor_id,latitude,longitude,bidding_active\n"
        "c1,40.75,-73.99,sometimes\n");
    EXPECT_THROW(DataLoader().load_cleaners(in, "mem"), ValidationError);
}

TEST(DataLoaderTest, LoadsMarketFromDirectory) {
    DataDirectory data;
    data.write("postal_codes.csv", POSTAL_CODES);
    DataLoader loader(data.path());
    Market nyc = loader.load_postal_market("nyc", 1.0);
    EXPECT_EQ(nyc.id(), "nyc");
    EXPECT_EQ(nyc.kind(), MarketKind::PostalCodeBased);
    ASSERT_NE(nyc.postal_area(), nullptr);
    EXPECT_EQ(nyc.postal_area()->cells.size(), 2u);
    EXPECT_DOUBLE_EQ(nyc.total_demand_weight(), 200.5);
    EXPECT_THROW(loader.load_postal_market("la", 1.0), ValidationError);
}

TEST(DataLoaderTest, LoadsCleanersFromDirectory) {
    DataDirectory data;
    data.write("cleaners.csv", "contractor_id,latitude,longitude\nc1,40.75,-73.99\nc2,40.7,-73.9\n");
    EXPECT_EQ(DataLoader(data.path() + "/").load_cleaners().size(), 2u);
}

TEST(DataLoaderTest, MissingFileThrows) {
    DataDirectory data;
    EXPECT_THROW(DataLoader(data.path()).load_cleaners(), std::runtime_error);
    EXPECT_THROW(DataLoader(data.path()).load_postal_codes(), std::runtime_error);
}

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "../src/Config.h"

using EngNotation::Notation;

namespace {

// Writes `content` to a fresh file in the temp directory, returns its path.
QString writeTempConfig(const std::string& name, const std::string& content)
{
    const auto path = std::filesystem::temp_directory_path() / ("engnotation_" + name + ".toml");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return QString::fromStdString(path.string());
}

} // namespace

TEST(ConfigTest, MissingFileKeepsDefaults)
{
    Config& cfg = Config::instance();
    const auto missing = std::filesystem::temp_directory_path() / "engnotation_does_not_exist.toml";
    std::filesystem::remove(missing);

    ASSERT_TRUE(cfg.load(QString::fromStdString(missing.string())));
    EXPECT_EQ(Notation::SI, cfg.notation());
    EXPECT_TRUE(cfg.unit().isEmpty());
    EXPECT_EQ(3, cfg.precision());
    EXPECT_EQ(Config::defaultSamples().size(), cfg.samples().size());
    EXPECT_EQ(QString("1.000 k"), cfg.format(1000));
}

TEST(ConfigTest, LoadsFormatSection)
{
    const QString path = writeTempConfig("format",
        "[format]\n"
        "notation = \"engineering\"\n"
        "unit = \"Ω\"\n"
        "precision = 2\n");

    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(path));
    EXPECT_EQ(path, cfg.configPath());
    EXPECT_EQ(Notation::Engineering, cfg.notation());
    EXPECT_EQ(QString("Ω"), cfg.unit());
    EXPECT_EQ(2, cfg.precision());
    EXPECT_EQ(QString("1.00E+15 Ω"), cfg.format(1e15));

    cfg.setNotation(Notation::SI);
    EXPECT_EQ(QString("1.00 PΩ"), cfg.format(1e15));
}

TEST(ConfigTest, LoadsSamples)
{
    const QString path = writeTempConfig("samples",
        "[[samples]]\n"
        "value = 15050.504\n"
        "unit = \"V\"\n"
        "\n"
        "[[samples]]\n"
        "value = 1000\n");

    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(path));
    ASSERT_EQ(2, cfg.samples().size());
    EXPECT_DOUBLE_EQ(15050.504, cfg.samples()[0].value);
    EXPECT_EQ(QString("V"), cfg.samples()[0].unit);
    EXPECT_DOUBLE_EQ(1000.0, cfg.samples()[1].value);
    EXPECT_TRUE(cfg.samples()[1].unit.isEmpty());
}

TEST(ConfigTest, ReloadResetsPreviousValues)
{
    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(writeTempConfig("reload_a", "[format]\nprecision = 5\nunit = \"A\"\n")));
    EXPECT_EQ(5, cfg.precision());

    ASSERT_TRUE(cfg.load(writeTempConfig("reload_b", "[format]\nnotation = \"si\"\n")));
    EXPECT_EQ(3, cfg.precision());
    EXPECT_TRUE(cfg.unit().isEmpty());
}

TEST(ConfigTest, RejectsInvalidValues)
{
    Config& cfg = Config::instance();

    EXPECT_FALSE(cfg.load(writeTempConfig("neg_precision", "[format]\nprecision = -1\n")));
    EXPECT_EQ(3, cfg.precision());

    EXPECT_FALSE(cfg.load(writeTempConfig("float_precision", "[format]\nprecision = 2.5\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("bad_notation", "[format]\nnotation = \"scientific\"\n")));
    EXPECT_EQ(Notation::SI, cfg.notation());

    EXPECT_FALSE(cfg.load(writeTempConfig("unit_type", "[format]\nunit = 5\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("sample_value", "[[samples]]\nvalue = \"abc\"\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("sample_missing", "[[samples]]\nunit = \"V\"\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("big_precision", "[format]\nprecision = 101\n")));
}

TEST(ConfigTest, RejectsNonFiniteSamples)
{
    Config& cfg = Config::instance();

    EXPECT_FALSE(cfg.load(writeTempConfig("sample_nan", "[[samples]]\nvalue = nan\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("sample_inf", "[[samples]]\nvalue = inf\n")));
    EXPECT_FALSE(cfg.load(writeTempConfig("sample_neg_inf",
        "[[samples]]\nvalue = 1.5\n\n[[samples]]\nvalue = -inf\n")));
    EXPECT_EQ(Config::defaultSamples().size(), cfg.samples().size());
}

TEST(ConfigTest, AcceptsLargestPrecision)
{
    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(writeTempConfig("max_precision", "[format]\nprecision = 100\n")));
    EXPECT_EQ(EngNotation::MAX_DECIMAL_PLACES, cfg.precision());
}

TEST(ConfigTest, RejectsMalformedToml)
{
    Config& cfg = Config::instance();
    EXPECT_FALSE(cfg.load(writeTempConfig("malformed", "[format\nprecision = \n")));
    EXPECT_EQ(3, cfg.precision());
}

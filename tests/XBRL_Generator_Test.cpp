// =====================================================================================
//
//       Filename:  XBRL_Generator_Test.cpp
//
//    Description:  tests for writing XBRL instance documents.
//
//        Version:  1.0
//        Created:  09/23/2026 10:21:05 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

	/* This file is part of RegReport_Engine. */

	/* RegReport_Engine is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* RegReport_Engine is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with RegReport_Engine.  If not, see <http://www.gnu.org/licenses/>. */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "RegReport_Utils.h"
#include "XBRL_Generator.h"
#include "XBRL_Parser.h"

using namespace testing;

namespace fs = std::filesystem;

const fs::path test_data_dir{REGREPORT_TEST_DATA_DIR};

class GenerateInstances : public Test
{
public:

    void SetUp() override
    {
        instance_.fact_namespaces_["rr"] = "http://example.com/regreport/2026";

        instance_.schema_ref_ = "sample_taxonomy.xsd";
        instance_.contexts_.push_back({"D_2025", "0000123456", RR::DurationPeriod{"2025-01-01", "2025-12-31"}});
        instance_.contexts_.push_back({"I_2025", "0000123456", RR::InstantPeriod{"2025-12-31"}});
        instance_.units_.push_back({"USD", "iso4217:USD"});
        instance_.units_.push_back({"shares", "xbrli:shares"});

        instance_.facts_.push_back({"rr:Revenue", "monetary", "duration", "1250000", "USD", "D_2025", "-3", "rr"});
        instance_.facts_.push_back({"rr:SharesOutstanding", "decimal", "instant", "1000", "shares", "I_2025", "0", "rr"});
        instance_.facts_.push_back({"rr:CompanyName", "string", "duration", "Example & Sons <Holdings>", std::nullopt, "D_2025",
                std::nullopt, "rr"});

        instance_.metadata_ = {"0000123456", "2025-12-31", "USD", "en"};
    }

    GeneratorSettings settings_;
    RR::XBRLInstance instance_;
};

TEST_F(GenerateInstances, DocumentStructure)
{
    auto doc = BuildXBRLDocument(instance_, settings_);
    auto root = doc.document_element();

    EXPECT_STREQ(root.name(), "xbrli:xbrl");
    EXPECT_STREQ(root.attribute("xmlns:xbrli").value(), "http://www.xbrl.org/2003/instance");
    EXPECT_STREQ(root.attribute("xmlns:iso4217").value(), "http://www.xbrl.org/2003/iso4217");
    EXPECT_STREQ(root.attribute("xmlns:rr").value(), "http://example.com/regreport/2026");
    EXPECT_STREQ(root.attribute("xml:lang").value(), "en");

    EXPECT_STREQ(root.child("link:schemaRef").attribute("xlink:href").value(), "sample_taxonomy.xsd");
    EXPECT_STREQ(root.child("link:schemaRef").attribute("xlink:type").value(), "simple");

    auto context = root.child("xbrli:context");
    EXPECT_STREQ(context.attribute("id").value(), "D_2025");
    EXPECT_STREQ(context.child("xbrli:entity").child("xbrli:identifier").attribute("scheme").value(), "http://www.sec.gov/CIK");
    EXPECT_STREQ(context.child("xbrli:period").child_value("xbrli:startDate"), "2025-01-01");

    auto revenue = root.child("rr:Revenue");
    ASSERT_TRUE(revenue);
    EXPECT_STREQ(revenue.attribute("contextRef").value(), "D_2025");
    EXPECT_STREQ(revenue.attribute("unitRef").value(), "USD");
    EXPECT_STREQ(revenue.attribute("decimals").value(), "-3");
    EXPECT_STREQ(revenue.child_value(), "1250000");

    EXPECT_FALSE(root.child("rr:CompanyName").attribute("unitRef"));
}

TEST_F(GenerateInstances, RatioUnitsAreDivided)
{
    instance_.units_.push_back({"eps", "iso4217:USD/xbrli:shares"});

    auto doc = BuildXBRLDocument(instance_, settings_);

    auto divide = doc.document_element().find_child_by_attribute("xbrli:unit", "id", "eps").child("xbrli:divide");
    ASSERT_TRUE(divide);
    EXPECT_STREQ(divide.child("xbrli:unitNumerator").child_value("xbrli:measure"), "iso4217:USD");
    EXPECT_STREQ(divide.child("xbrli:unitDenominator").child_value("xbrli:measure"), "xbrli:shares");
}

TEST_F(GenerateInstances, UnqualifiedNamesGetTheirPrefixAndADefaultContext)
{
    RR::XBRLFact fact;
    fact.name_ = "Assets";
    fact.namespace_ = "rr";
    fact.value_ = "10";
    instance_.facts_ = {fact};

    auto doc = BuildXBRLDocument(instance_, settings_);

    auto assets = doc.document_element().child("rr:Assets");
    ASSERT_TRUE(assets);
    EXPECT_STREQ(assets.attribute("contextRef").value(), "default");
}

TEST_F(GenerateInstances, SerializedTextIsEscaped)
{
    auto text = SerializeXBRLDocument(BuildXBRLDocument(instance_, settings_));

    EXPECT_THAT(text, StartsWith(R"(<?xml version="1.0" encoding="UTF-8"?>)"));
    EXPECT_THAT(text, HasSubstr("Example &amp; Sons &lt;Holdings&gt;"));
}

TEST_F(GenerateInstances, ParsingWhatWeWriteGivesItBack)
{
    auto text = SerializeXBRLDocument(BuildXBRLDocument(instance_, settings_));

    auto parsed = ParseXBRLInstance(RR::XMLContent{text});

    EXPECT_EQ(parsed.schema_ref_, instance_.schema_ref_);
    EXPECT_EQ(parsed.contexts_, instance_.contexts_);
    EXPECT_EQ(parsed.units_, instance_.units_);
    EXPECT_EQ(parsed.facts_, instance_.facts_);
    EXPECT_EQ(parsed.metadata_, instance_.metadata_);
    EXPECT_EQ(parsed, instance_);
}

TEST_F(GenerateInstances, SettingsNamespacesAreAddedAndWin)
{
    settings_.namespaces_.fact_namespaces_["rr"] = "http://example.com/regreport/2027";
    settings_.namespaces_.fact_namespaces_["ext"] = "http://example.com/ext";

    auto root = BuildXBRLDocument(instance_, settings_).document_element();

    EXPECT_STREQ(root.attribute("xmlns:rr").value(), "http://example.com/regreport/2027");
    EXPECT_STREQ(root.attribute("xmlns:ext").value(), "http://example.com/ext");
}

TEST_F(GenerateInstances, UndeclaredPrefixesThrow)
{
    instance_.fact_namespaces_.clear();
    EXPECT_THROW(BuildXBRLDocument(instance_, settings_), XBRLException);

    instance_.fact_namespaces_["rr"] = "http://example.com/regreport/2026";
    instance_.units_.push_back({"w", "u:Widgets"});
    EXPECT_THROW(BuildXBRLDocument(instance_, settings_), XBRLException);
}

TEST_F(GenerateInstances, ParsedSampleWritesBackWithDefaultSettings)
{
    auto original = LoadXBRLInstance(RR::FileName{test_data_dir / "sample_instance.xml"});

    auto text = SerializeXBRLDocument(BuildXBRLDocument(original, GeneratorSettings{}));

    EXPECT_THAT(text, HasSubstr(R"(xmlns:rr="http://example.com/regreport/2026")"));
    EXPECT_THAT(text, HasSubstr("<xbrli:measure>iso4217:USD</xbrli:measure>"));

    auto parsed = ParseXBRLInstance(RR::XMLContent{text});
    EXPECT_EQ(parsed, original);
}

TEST_F(GenerateInstances, WrittenReportCanBeLoaded)
{
    const fs::path output_dir = fs::temp_directory_path() / "RegReport_Generator_Test";
    fs::remove_all(output_dir);
    fs::create_directories(output_dir);

    const RR::FileName report_name{output_dir / "report.xml"};
    WriteXBRLReport(instance_, report_name, settings_);

    ASSERT_TRUE(fs::exists(report_name.get()));
    auto loaded = LoadXBRLInstance(report_name);
    EXPECT_EQ(loaded, instance_);

    fs::remove_all(output_dir);
}

class CompareFacts : public Test
{
};

TEST_F(CompareFacts, NumbersCompareByValue)
{
    RR::XBRLFact lhs{"rr:Revenue", "monetary", "duration", "1250000", "USD", "D", "0", "rr"};
    RR::XBRLFact rhs = lhs;

    rhs.value_ = "1250000.00";
    EXPECT_TRUE(FactsEquivalent(lhs, rhs));

    rhs.value_ = "1250001";
    EXPECT_FALSE(FactsEquivalent(lhs, rhs));

    rhs = lhs;
    rhs.unit_ = "EUR";
    EXPECT_FALSE(FactsEquivalent(lhs, rhs));

    rhs = lhs;
    rhs.value_ = "one";
    EXPECT_FALSE(FactsEquivalent(lhs, rhs));
}

#include <html2org/convert/table_context.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using html2org::convert::format_table;
using html2org::convert::make_default_pretty_table_options;
using html2org::convert::Options;
using html2org::convert::PrettyTableOptions;
using html2org::convert::TableContext;

namespace {

TableContext make_header_footer_table() {
    TableContext table;
    table.begin_row();
    table.add_header_cell("Header 1");
    table.add_header_cell("Header 2");
    table.end_row();

    table.set_in_footer(true);
    table.begin_row();
    table.add_data_cell("Footer 1");
    table.add_data_cell("Footer 2");
    table.end_row();
    table.set_in_footer(false);

    table.begin_row();
    table.add_data_cell("Row 1 Col 1");
    table.add_data_cell("Row 1 Col 2");
    table.end_row();
    table.begin_row();
    table.add_data_cell("Row 2 Col 1");
    table.add_data_cell("Row 2 Col 2");
    table.end_row();
    return table;
}

}  // namespace

TEST(TableContextTest, RoutesCellsToSections) {
    const TableContext table = make_header_footer_table();

    EXPECT_EQ(table.header(), (std::vector<std::string>{"Header 1", "Header 2"}));
    EXPECT_EQ(table.footer(), (std::vector<std::string>{"Footer 1", "Footer 2"}));
    ASSERT_EQ(table.body().size(), 4u);
    EXPECT_TRUE(table.body()[0].empty());
    EXPECT_TRUE(table.body()[1].empty());
    EXPECT_EQ(table.body()[2], (std::vector<std::string>{"Row 1 Col 1", "Row 1 Col 2"}));
    EXPECT_EQ(table.body()[3], (std::vector<std::string>{"Row 2 Col 1", "Row 2 Col 2"}));
    EXPECT_FALSE(table.in_footer());
}

TEST(TableContextTest, CellOutsideRowStartsOne) {
    TableContext table;
    table.add_data_cell("loose");
    ASSERT_EQ(table.body().size(), 1u);
    EXPECT_EQ(table.body()[0], (std::vector<std::string>{"loose"}));
}

TEST(TableContextTest, FormatsOrgTable) {
    Options options;
    options.pretty_table_options = make_default_pretty_table_options();

    EXPECT_EQ(format_table(make_header_footer_table(), options),
              "\n"
              "|  HEADER 1   |  HEADER 2   |\n"
              "|-------------+-------------|\n"
              "| Row 1 Col 1 | Row 1 Col 2 |\n"
              "| Row 2 Col 1 | Row 2 Col 2 |\n"
              "|-------------+-------------|\n"
              "|  FOOTER 1   |  FOOTER 2   |");
}

TEST(TableContextTest, EmptyCellsKeepColumns) {
    TableContext table;
    table.begin_row();
    table.add_data_cell("");
    table.add_data_cell("");
    table.end_row();

    EXPECT_EQ(format_table(table, Options{}), "\n|  |  |");
}

TEST(TableContextTest, PlainAsciiWhenOrgFormatOff) {
    TableContext table;
    table.begin_row();
    table.add_data_cell("cell");
    table.end_row();

    PrettyTableOptions pretty = make_default_pretty_table_options();
    pretty.org_format = false;
    Options options;
    options.pretty_table_options = pretty;

    EXPECT_EQ(format_table(table, options),
              "+------+\n"
              "| cell |\n"
              "+------+\n");
}

TEST(TableContextTest, DefaultStyleWrapsLongCells) {
    TableContext table;
    table.begin_row();
    table.add_data_cell("Open source programming language that makes it easy");
    table.end_row();

    const std::string text = format_table(table, Options{});
    EXPECT_NE(text.find("\n| Open source programming        |"), std::string::npos);
}

// EN: Unit tests for $(params.*) and $(tasks.*.results.*) substitution
// FR: Tests unitaires de la substitution $(params.*) et $(tasks.*.results.*)

#include <gtest/gtest.h>
#include "reconciler/substitution.hpp"
#include "test_helpers.hpp"

using namespace PRR;
using namespace PRR::Reconciler;

class SubstitutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        replacements_.strings["params.revision"] = "main";
        replacements_.strings["params.rev"] = "revision";
        replacements_.arrays["params.flags"] = {"-v", "-x"};
    }

    Replacements replacements_;
};

TEST_F(SubstitutionTest, ReplacesKnownExpressions) {
    EXPECT_EQ(Substitution::applyStringReplacements("git checkout $(params.revision)", replacements_.strings),
              "git checkout main");
    EXPECT_EQ(Substitution::applyStringReplacements("$(params.revision)/$(params.revision)", replacements_.strings),
              "main/main");
}

TEST_F(SubstitutionTest, UnknownExpressionsAreLeftAlone) {
    EXPECT_EQ(Substitution::applyStringReplacements("$(params.missing) $(context.run)", replacements_.strings),
              "$(params.missing) $(context.run)");
    EXPECT_EQ(Substitution::applyStringReplacements("plain text", replacements_.strings), "plain text");
    EXPECT_EQ(Substitution::applyStringReplacements("$(params.revision", replacements_.strings), "$(params.revision");
}

TEST_F(SubstitutionTest, InnermostExpressionIsReplacedFirst) {
    EXPECT_EQ(Substitution::applyStringReplacements("$(inputs.workspace.$(params.rev))", replacements_.strings),
              "$(inputs.workspace.revision)");
}

TEST_F(SubstitutionTest, ReplacedTextIsNotExpandedAgain) {
    std::map<std::string, std::string> strings{{"params.a", "$(params.b)"}, {"params.b", "deep"}};

    EXPECT_EQ(Substitution::applyStringReplacements("$(params.a)", strings), "$(params.b)");
}

TEST_F(SubstitutionTest, ArrayElementExpandsInPlace) {
    std::vector<std::string> args{"build", "$(params.flags)", "--rev=$(params.revision)"};

    EXPECT_EQ(Substitution::applyArrayReplacements(args, replacements_),
              (std::vector<std::string>{"build", "-v", "-x", "--rev=main"}));
}

TEST_F(SubstitutionTest, ArrayInsideLongerStringIsNotExpanded) {
    std::vector<std::string> args{"x$(params.flags)"};

    EXPECT_EQ(Substitution::applyArrayReplacements(args, replacements_), args);
}

TEST_F(SubstitutionTest, StepFieldsAreSubstituted) {
    Api::Step step;
    step.name = "$(params.revision)";
    step.image = "golang:$(params.revision)";
    step.command = {"go", "$(params.flags)"};
    step.args = {"$(params.revision)"};
    step.script = "echo $(params.revision)";

    Api::Step result = Substitution::applyToStep(step, replacements_);

    EXPECT_EQ(result.name, "$(params.revision)");
    EXPECT_EQ(result.image, "golang:main");
    EXPECT_EQ(result.command, (std::vector<std::string>{"go", "-v", "-x"}));
    EXPECT_EQ(result.args, (std::vector<std::string>{"main"}));
    EXPECT_EQ(result.script, "echo main");
}

TEST_F(SubstitutionTest, ProvidedParamsOverrideDefaults) {
    Api::ParamSpec flags;
    flags.name = "flags";
    flags.type = Api::ParamType::ARRAY;
    flags.default_value = Api::ParamValue(std::vector<std::string>{"-q"});

    std::vector<Api::ParamSpec> declared{Testing::stringParam("revision", "main"), Testing::stringParam("mode"), flags};
    std::vector<Api::Param> provided{{"revision", Api::ParamValue("v2")}};

    Replacements result = Substitution::paramReplacements(declared, provided);

    EXPECT_EQ(result.strings.at("params.revision"), "v2");
    EXPECT_EQ(result.strings.count("params.mode"), 0u);
    EXPECT_EQ(result.arrays.at("params.flags"), (std::vector<std::string>{"-q"}));
}

TEST_F(SubstitutionTest, ParamsAreSubstitutedByType) {
    std::vector<Api::Param> params{
        {"ref", Api::ParamValue("$(params.revision)")},
        {"all", Api::ParamValue(std::vector<std::string>{"$(params.flags)", "-z"})},
    };

    auto result = Substitution::applyToParams(params, replacements_);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].value, Api::ParamValue("main"));
    EXPECT_EQ(result[1].value, Api::ParamValue(std::vector<std::string>{"-v", "-x", "-z"}));
}

TEST_F(SubstitutionTest, ExtractsDistinctResultReferences) {
    auto references = Substitution::extractResultReferences(
        std::string("$(tasks.build.results.digest) $(tasks.scan.results.report) $(tasks.build.results.digest)"));

    ASSERT_EQ(references.size(), 2u);
    EXPECT_EQ(references[0], (ResultReference{"build", "digest"}));
    EXPECT_EQ(references[1], (ResultReference{"scan", "report"}));
    EXPECT_EQ(references[0].key(), "tasks.build.results.digest");

    EXPECT_TRUE(Substitution::extractResultReferences(std::string("$(params.revision)")).empty());
}

TEST_F(SubstitutionTest, ExtractsReferencesFromArrays) {
    Api::ParamValue value(std::vector<std::string>{"$(tasks.a.results.x)", "$(tasks.a.results.x)-$(tasks.b.results.y)"});

    auto references = Substitution::extractResultReferences(value);

    EXPECT_EQ(references, (std::vector<ResultReference>{{"a", "x"}, {"b", "y"}}));
}

TEST_F(SubstitutionTest, ContainsExpression) {
    EXPECT_TRUE(Substitution::containsExpression("$(workspaces.src.path)/out", "workspaces."));
    EXPECT_FALSE(Substitution::containsExpression("workspaces.src", "workspaces."));
}

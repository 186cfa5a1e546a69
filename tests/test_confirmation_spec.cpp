#include <gtest/gtest.h>
#include "confirm/ConfirmationSpec.hpp"

TEST(ConfirmationSpecTest, LowNeverConfirms) {
    for (auto env : {EnvironmentClass::Development, EnvironmentClass::Staging,
                     EnvironmentClass::Production, EnvironmentClass::Unknown})
        EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::Low, env),
                  ConfirmationModality::None);
}

TEST(ConfirmationSpecTest, MediumIsYesNoEverywhere) {
    for (auto env : {EnvironmentClass::Development, EnvironmentClass::Staging,
                     EnvironmentClass::Production, EnvironmentClass::Unknown})
        EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::Medium, env),
                  ConfirmationModality::YesNo);
}

TEST(ConfirmationSpecTest, HighIsTypedOnlyInProduction) {
    EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::High, EnvironmentClass::Production),
              ConfirmationModality::TypedPhrase);
    EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::High, EnvironmentClass::Staging),
              ConfirmationModality::YesNo);
    EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::High, EnvironmentClass::Development),
              ConfirmationModality::YesNo);
    EXPECT_EQ(ConfirmationSpec::modalityFor(RiskLevel::High, EnvironmentClass::Unknown),
              ConfirmationModality::YesNo);
}

TEST(ConfirmationSpecTest, DeriveFillsPhraseForTypedOnly) {
    auto typed = ConfirmationSpec::derive("kubectl delete deployment nginx",
                                          RiskLevel::High, EnvironmentClass::Production);
    EXPECT_EQ(typed.modality, ConfirmationModality::TypedPhrase);
    EXPECT_EQ(typed.expectedPhrase, "nginx");

    auto yesNo = ConfirmationSpec::derive("kubectl delete deployment nginx",
                                          RiskLevel::High, EnvironmentClass::Staging);
    EXPECT_EQ(yesNo.modality, ConfirmationModality::YesNo);
    EXPECT_TRUE(yesNo.expectedPhrase.empty());
}

TEST(ResourceNameTest, TypeThenName) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete deployment nginx", EnvironmentClass::Production), "nginx");
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete pod test-pod -n production", EnvironmentClass::Production), "test-pod");
}

TEST(ResourceNameTest, FlagsBeforeNameAreSkipped) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete -n payments deployment api", EnvironmentClass::Production), "api");
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete --namespace=payments deployment api", EnvironmentClass::Production), "api");
}

TEST(ResourceNameTest, QuotesAreRemovedLikeTheExecutorDoes) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete deployment 'nginx'", EnvironmentClass::Production), "nginx");
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl del''ete deployment \"api\" -n web", EnvironmentClass::Production), "api");
}

TEST(ResourceNameTest, SlashForm) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete deployment/nginx", EnvironmentClass::Production), "nginx");
}

TEST(ResourceNameTest, SingleNameVerbs) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl drain node-01 --ignore-daemonsets", EnvironmentClass::Production), "node-01");
}

TEST(ResourceNameTest, ScaleToZeroUsesDeploymentName) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl scale deployment api --replicas 0", EnvironmentClass::Production), "api");
}

TEST(ResourceNameTest, FallsBackToEnvironmentWord) {
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete all --all", EnvironmentClass::Production), "production");
    EXPECT_EQ(ConfirmationSpec::extractResourceName(
        "kubectl delete", EnvironmentClass::Production), "production");
}

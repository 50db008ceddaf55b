#include <gtest/gtest.h>
#include "layers/Mask.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

using namespace nl::layers;

TEST(MaskTest, DefaultIsEmpty) {
    const Mask m;
    EXPECT_EQ(m.bits(), 0u);
    EXPECT_FALSE(m.isNonEmpty());
    EXPECT_EQ(m.layerCount(), 0u);
    EXPECT_TRUE(m.begin() == m.end());
}

TEST(MaskTest, IntegerIsLayerIndexNotBits) {
    const Mask m(3);
    EXPECT_EQ(m.bits(), 1u << 3);
    EXPECT_EQ(m.layerCount(), 1u);
    EXPECT_FALSE(m.contains(0));
    EXPECT_FALSE(m.contains(1));
}

TEST(MaskTest, FromBitsUsesPatternVerbatim) {
    const auto m = Mask::fromBits(3);
    EXPECT_EQ(m.bits(), 3u);
    EXPECT_EQ(m.layerCount(), 2u);
    EXPECT_TRUE(m.contains(0));
    EXPECT_TRUE(m.contains(1));
    EXPECT_EQ(m, Mask(0, 1));
}

TEST(MaskTest, FromLayerMatchesIndexConstructor) {
    EXPECT_EQ(Mask::fromLayer(7), Mask(7));
    EXPECT_EQ(Mask::fromLayer(7).bits(), 1u << 7);
}

TEST(MaskTest, LayerAndIndexAgree) {
    EXPECT_EQ(Mask(Layer::Water), Mask(4));
    EXPECT_EQ(Mask(Layer::L31).bits(), 1u << 31);
    EXPECT_EQ(Mask(Layer::Default).bits(), 1u);
}

TEST(MaskTest, CollectionsAreUnioned) {
    EXPECT_EQ(Mask(std::vector<int>{1, 2, 3}).bits(), 0b1110u);
    EXPECT_EQ(Mask(std::vector<Layer>{Layer::UI, Layer::Water}), Mask(4, 5));
    EXPECT_EQ(Mask(std::vector<Mask>{Mask(1), Mask(2, 3)}), Mask(1, 2, 3));
    EXPECT_EQ(Mask(std::array<unsigned int, 2>{0u, 31u}).bits(), 0x80000001u);
    EXPECT_EQ(Mask(std::vector<int>{}), Mask());
}

TEST(MaskTest, DuplicateLayersCollapse) {
    const Mask m(2, 2, 2);
    EXPECT_EQ(m.layerCount(), 1u);
    EXPECT_EQ(m, Mask(2));
}

TEST(MaskTest, MixedOperandShapes) {
    const Mask m(Layer::Default, 3, Mask(5), std::vector<Layer>{Layer::Clickables});
    EXPECT_EQ(m.bits(), (1u << 0) | (1u << 3) | (1u << 5) | (1u << 8));
}

TEST(MaskTest, AllLayers) {
    const auto& all = Mask::allLayers();
    EXPECT_EQ(all.layerCount(), 32u);
    EXPECT_EQ(all.bits(), 0xFFFFFFFFu);
    for (int i = 0; i < 32; ++i) EXPECT_TRUE(all.contains(i)) << "layer " << i;
}

TEST(MaskTest, SingleLayerEquality) {
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(Mask(i), Mask(i));
        for (int j = 0; j < 32; ++j)
            if (i != j) EXPECT_NE(Mask(i), Mask(j)) << i << " vs " << j;
    }
}

TEST(MaskTest, EqualityWithLayerMeansExactlyThatLayer) {
    EXPECT_TRUE(Mask(1, 2).contains(1));
    EXPECT_FALSE(Mask(1, 2) == 1);
    EXPECT_TRUE(Mask(1, 2) != 1);
    EXPECT_TRUE(Mask(1) == 1);
    EXPECT_TRUE(1 == Mask(1));
    EXPECT_FALSE(2 == Mask(1, 2));

    EXPECT_TRUE(Mask(Layer::UI) == Layer::UI);
    EXPECT_TRUE(Layer::UI == Mask(Layer::UI));
    EXPECT_TRUE(Mask(Layer::UI, Layer::Water) != Layer::UI);
    EXPECT_FALSE(Mask() == Layer::Default);
}

TEST(MaskTest, EqualityWithCollectionMeansExactlyTheUnion) {
    EXPECT_TRUE(Mask(1, 2, 3) == (std::vector<int>{3, 2, 1}));
    EXPECT_TRUE((std::vector<int>{1, 2}) != Mask(1, 2, 3));
    EXPECT_TRUE(Mask(4, 5) == (std::vector<Layer>{Layer::Water, Layer::UI}));
    EXPECT_TRUE(Mask(1, 2, 3) == (std::vector<Mask>{Mask(1), Mask(2, 3)}));
    EXPECT_TRUE(Mask() == std::vector<int>{});
}

TEST(MaskTest, HashIsBits) {
    EXPECT_EQ(std::hash<Mask>{}(Mask(0, 2)), 5u);

    std::unordered_set<Mask> set;
    set.insert(Mask(1, 2));
    set.insert(Mask(2, 1));
    set.insert(Mask::fromBits(0b110));
    EXPECT_EQ(set.size(), 1u);
}

TEST(MaskTest, ContainsMask) {
    const Mask m(1, 2, 3);
    EXPECT_TRUE(m.contains(Mask(1, 3)));
    EXPECT_TRUE(m.contains(m));
    EXPECT_FALSE(m.contains(Mask(1, 4)));
    EXPECT_FALSE(Mask(1).contains(m));
}

TEST(MaskTest, EveryMaskContainsTheEmptyMask) {
    for (const auto& m : {Mask(), Mask(0), Mask(31), Mask(1, 2, 3), Mask::allLayers()})
        EXPECT_TRUE(m.contains(Mask())) << m;
}

TEST(MaskTest, ContainsAndNotEmpty) {
    EXPECT_FALSE(Mask().containsAndNotEmpty(Mask(5)));
    EXPECT_FALSE(Mask(5).containsAndNotEmpty(Mask()));
    EXPECT_FALSE(Mask().containsAndNotEmpty(Mask()));
    EXPECT_TRUE(Mask(5).containsAndNotEmpty(Mask(5)));
    EXPECT_TRUE(Mask(5, 6).containsAndNotEmpty(Mask(6)));
    EXPECT_FALSE(Mask(5).containsAndNotEmpty(Mask(5, 6)));
}

TEST(MaskTest, ContainsSingleIndex) {
    for (int i = 0; i < 32; ++i) {
        EXPECT_TRUE(Mask(i).contains(i));
        for (int j = 0; j < 32; ++j)
            if (i != j) EXPECT_FALSE(Mask(i).contains(j)) << i << " contains " << j;
    }
}

TEST(MaskTest, ContainsLayerAndCollection) {
    const Mask m(Layer::UI, Layer::Water);
    EXPECT_TRUE(m.contains(Layer::UI));
    EXPECT_FALSE(m.contains(Layer::Default));
    EXPECT_TRUE(m.contains(std::vector<Layer>{Layer::UI, Layer::Water}));
    EXPECT_FALSE(m.contains(std::vector<int>{4, 6}));
}

TEST(MaskTest, IteratesInAscendingOrder) {
    const Mask m(3, 1, 2);
    const std::vector<Layer> expected{Layer::TransparentFX, Layer::IgnoreRaycast, Layer::L3};

    std::vector<Layer> first, second;
    for (const auto layer : m) first.push_back(layer);
    for (const auto layer : m) second.push_back(layer);

    EXPECT_EQ(first, expected);
    EXPECT_EQ(second, expected);
    EXPECT_EQ(m.layers(), expected);
}

TEST(MaskTest, IterationCoversWholeUniverse) {
    unsigned int expected = 0;
    for (const auto layer : Mask::allLayers()) EXPECT_EQ(toIndex(layer), expected++);
    EXPECT_EQ(expected, 32u);
}

TEST(MaskTest, NumericViews) {
    EXPECT_EQ(Mask(0, 31).bits(), 0x80000001u);
    EXPECT_TRUE(Mask(0).isNonEmpty());
    EXPECT_TRUE(Mask(31).isNonEmpty());
    EXPECT_FALSE(Mask::fromBits(0).isNonEmpty());
}

TEST(MaskTest, OutOfRangeLayerIsRejected) {
    EXPECT_THROW(static_cast<void>(Mask(32)), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(-1)), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(static_cast<Layer>(40))), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask::fromLayer(100)), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(std::vector<int>{1, 99})), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(1).contains(32)), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(1) == 33), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(Mask(64u)), std::out_of_range);
}

TEST(MaskTest, OutOfRangeLayerNamesTheValue) {
    try {
        static_cast<void>(Mask(-1));
        FAIL() << "expected OutOfRangeLayer";
    } catch (const OutOfRangeLayer& e) {
        EXPECT_EQ(e.value(), "-1");
        EXPECT_NE(std::string(e.what()).find("-1"), std::string::npos);
    }

    try {
        static_cast<void>(Mask(uint64_t{1} << 40));
        FAIL() << "expected OutOfRangeLayer";
    } catch (const OutOfRangeLayer& e) {
        EXPECT_EQ(e.value(), "1099511627776");
    }
}

TEST(MaskTest, LayerIndexHelpers) {
    EXPECT_EQ(toIndex(Layer::Clickables), 8u);
    EXPECT_EQ(layerFromIndex(5), Layer::UI);
    EXPECT_THROW(static_cast<void>(layerFromIndex(32)), OutOfRangeLayer);
    EXPECT_THROW(static_cast<void>(toIndex(static_cast<Layer>(255))), OutOfRangeLayer);
}

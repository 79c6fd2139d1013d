#include "plants/plant_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "mocks/mock_plant_store.hpp"

using namespace greenhouse;
using namespace greenhouse::plants;
using namespace greenhouse::tests;
using namespace testing;

class PlantServiceTest : public Test {
protected:
    void SetUp() override { service = std::make_unique<PlantService>(store); }

    static NewPlant valid_fields() {
        NewPlant fields;
        fields.name = "Aloe";
        fields.image = "aloe.jpg";
        fields.price = 15.0;
        return fields;
    }

    StrictMock<MockPlantStore> store;
    std::unique_ptr<PlantService> service;
};

//=============================================================================
// Create
//=============================================================================

TEST_F(PlantServiceTest, CreateStoresAndReturnsPlant) {
    EXPECT_CALL(store, insert_plant(_, _, _)).WillOnce(Invoke([](const NewPlant &fields, Plant &out, std::string &) {
        out = make_plant(1, fields);
        return true;
    }));

    auto result = service->create_plant(valid_fields());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.status, PlantStatus::OK);
    ASSERT_TRUE(result.plant.has_value());
    EXPECT_EQ(result.plant->id, 1);
    EXPECT_TRUE(result.plant->is_in_stock);
}

TEST_F(PlantServiceTest, CreateRejectsEmptyNameWithoutTouchingStore) {
    auto fields = valid_fields();
    fields.name = "";

    auto result = service->create_plant(fields);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, PlantStatus::INVALID_ARGUMENT);
    EXPECT_EQ(result.error_message, "Field 'name' must not be empty");
}

TEST_F(PlantServiceTest, CreateRejectsNegativePrice) {
    auto fields = valid_fields();
    fields.price = -1.0;

    auto result = service->create_plant(fields);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, PlantStatus::INVALID_ARGUMENT);
}

TEST_F(PlantServiceTest, CreateRejectsNonFinitePrice) {
    auto fields = valid_fields();
    fields.price = std::numeric_limits<double>::infinity();

    auto result = service->create_plant(fields);

    EXPECT_EQ(result.status, PlantStatus::INVALID_ARGUMENT);
}

TEST_F(PlantServiceTest, CreateAllowsZeroPrice) {
    auto fields = valid_fields();
    fields.price = 0.0;

    EXPECT_CALL(store, insert_plant(_, _, _)).WillOnce(Invoke([](const NewPlant &f, Plant &out, std::string &) {
        out = make_plant(2, f);
        return true;
    }));

    EXPECT_TRUE(service->create_plant(fields).success);
}

TEST_F(PlantServiceTest, CreateStorageFailureIsDistinguished) {
    EXPECT_CALL(store, insert_plant(_, _, _))
        .WillOnce(DoAll(SetArgReferee<2>(std::string("NOT NULL constraint failed: plants.name")), Return(false)));

    auto result = service->create_plant(valid_fields());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, PlantStatus::STORAGE_FAILURE);
    EXPECT_EQ(result.error_message, "NOT NULL constraint failed: plants.name");
}

//=============================================================================
// Read
//=============================================================================

TEST_F(PlantServiceTest, GetMissingPlantIsNotFound) {
    EXPECT_CALL(store, find_plant(9, _, _)).WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{}), Return(true)));

    auto result = service->get_plant(9);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, PlantStatus::NOT_FOUND);
}

TEST_F(PlantServiceTest, ListStorageFailure) {
    EXPECT_CALL(store, list_plants(_, _))
        .WillOnce(DoAll(SetArgReferee<1>(std::string("disk I/O error")), Return(false)));

    auto result = service->list_plants();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, PlantStatus::STORAGE_FAILURE);
    EXPECT_EQ(result.error_message, "disk I/O error");
}

//=============================================================================
// Update
//=============================================================================

TEST_F(PlantServiceTest, UpdateChangesOnlyPatchedField) {
    EXPECT_CALL(store, find_plant(1, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{make_test_plant(1)}), Return(true)));

    Plant written;
    EXPECT_CALL(store, update_plant(_, _, _))
        .WillOnce(DoAll(SaveArg<0>(&written), SetArgReferee<1>(true), Return(true)));

    PlantPatch patch;
    patch.is_in_stock = false;
    auto result = service->update_plant(1, patch);

    ASSERT_TRUE(result.success);
    Plant expected = make_test_plant(1);
    expected.is_in_stock = false;
    EXPECT_EQ(*result.plant, expected);
    EXPECT_EQ(written, expected);
}

TEST_F(PlantServiceTest, UpdateMissingPlantIsNotFound) {
    EXPECT_CALL(store, find_plant(3, _, _)).WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{}), Return(true)));

    PlantPatch patch;
    patch.price = 1.0;
    auto result = service->update_plant(3, patch);

    EXPECT_EQ(result.status, PlantStatus::NOT_FOUND);
}

TEST_F(PlantServiceTest, UpdateRejectsNegativePrice) {
    EXPECT_CALL(store, find_plant(1, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{make_test_plant(1)}), Return(true)));

    PlantPatch patch;
    patch.price = -5.0;
    auto result = service->update_plant(1, patch);

    EXPECT_EQ(result.status, PlantStatus::INVALID_ARGUMENT);
}

TEST_F(PlantServiceTest, EmptyPatchSkipsWrite) {
    EXPECT_CALL(store, find_plant(1, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{make_test_plant(1)}), Return(true)));

    auto result = service->update_plant(1, PlantPatch{});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.plant, make_test_plant(1));
}

TEST_F(PlantServiceTest, UpdateStorageFailure) {
    EXPECT_CALL(store, find_plant(1, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{make_test_plant(1)}), Return(true)));
    EXPECT_CALL(store, update_plant(_, _, _))
        .WillOnce(DoAll(SetArgReferee<2>(std::string("database is locked")), Return(false)));

    PlantPatch patch;
    patch.name = "Renamed";
    auto result = service->update_plant(1, patch);

    EXPECT_EQ(result.status, PlantStatus::STORAGE_FAILURE);
    EXPECT_EQ(result.error_message, "database is locked");
}

TEST_F(PlantServiceTest, UpdateRowVanishedBeforeWrite) {
    EXPECT_CALL(store, find_plant(1, _, _))
        .WillOnce(DoAll(SetArgReferee<1>(OptionalPlant{make_test_plant(1)}), Return(true)));
    EXPECT_CALL(store, update_plant(_, _, _)).WillOnce(DoAll(SetArgReferee<1>(false), Return(true)));

    PlantPatch patch;
    patch.name = "Renamed";
    auto result = service->update_plant(1, patch);

    EXPECT_EQ(result.status, PlantStatus::NOT_FOUND);
}

//=============================================================================
// Delete
//=============================================================================

TEST_F(PlantServiceTest, DeleteExistingPlant) {
    EXPECT_CALL(store, delete_plant(4, _, _)).WillOnce(DoAll(SetArgReferee<1>(true), Return(true)));

    auto result = service->delete_plant(4);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.plant.has_value());
}

TEST_F(PlantServiceTest, DeleteMissingPlantIsNotFound) {
    EXPECT_CALL(store, delete_plant(4, _, _)).WillOnce(DoAll(SetArgReferee<1>(false), Return(true)));

    EXPECT_EQ(service->delete_plant(4).status, PlantStatus::NOT_FOUND);
}

TEST(PlantStatusTest, ToString) {
    EXPECT_EQ(plant_status_to_string(PlantStatus::OK), "OK");
    EXPECT_EQ(plant_status_to_string(PlantStatus::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_EQ(plant_status_to_string(PlantStatus::NOT_FOUND), "NOT_FOUND");
    EXPECT_EQ(plant_status_to_string(PlantStatus::STORAGE_FAILURE), "STORAGE_FAILURE");
}

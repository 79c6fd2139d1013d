#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer.
 * Implementation is split by resource under handlers/.
 *
 * Endpoints:
 * - GET    /plants        -> handle_get_plants     (plant_collection_handlers.cpp)
 * - POST   /plants        -> handle_post_plants    (plant_collection_handlers.cpp)
 * - GET    /plants/{id}   -> handle_get_plant      (plant_item_handlers.cpp)
 * - PATCH  /plants/{id}   -> handle_patch_plant    (plant_item_handlers.cpp)
 * - DELETE /plants/{id}   -> handle_delete_plant   (plant_item_handlers.cpp)
 *
 * Responses are JSON: a plant object, an array of plant objects,
 * {"error": "Plant not found"} (404) or {"errors": [message]} (400/500).
 * DELETE answers 204 with an empty body.
 */

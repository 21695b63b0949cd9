#pragma once

namespace spectral {

/// Event names carried on the MessageBus.
namespace events {

// Weapons (consumed: projectile tracking)
constexpr const char* WeaponFired     = "weapon.fired";
constexpr const char* TurretFire      = "turret.fire";
constexpr const char* MissileFired    = "missile.fired";

// Damage and destruction
constexpr const char* EntityDamaged   = "entity.damaged";
constexpr const char* EntityDestroyed = "entity.destroyed";
constexpr const char* CombatHit       = "combat.hit";

// Docking
constexpr const char* PlayerDocked    = "player.docked";
constexpr const char* PlayerUndocked  = "player.undocked";

// Horde mode
constexpr const char* HordeActivated  = "horde.activated";
constexpr const char* HordeWaveStart  = "horde.waveStart";
constexpr const char* HordeBossSpawn  = "horde.bossSpawn";
constexpr const char* HordeEnded      = "horde.ended";

// Effects
constexpr const char* VfxExplosion    = "vfx.explosion";
constexpr const char* VfxPulse        = "vfx.pulse";

// Enemy pipeline
constexpr const char* EnemySpawned        = "enemy.spawned";
constexpr const char* DifficultyLevelUp   = "difficulty.levelUp";

} // namespace events
} // namespace spectral

#include "ronin/Player.h"
#include "ronin/Log.h"

#include <algorithm>

using namespace std;

namespace ronin {

const char *motionStateName(MotionState s) {
    switch(s) {
    case MotionState::Running: return "running";
    case MotionState::Jumping: return "jumping";
    case MotionState::DoubleJumping: return "double_jumping";
    case MotionState::Ducking: return "ducking";
    }
    return "?";
}

void Player::reset() {
    height = 0;
    vy = 0;
    motion = MotionState::Running;
    isDefeated = false;
    hasEffect = false;
    effect = ActivePowerUp();
    bufferedJump = 0;
    frameIndex = 0;
    frameTimer = 0;
    dustTimer = 0;
    trailTimer = 0;
}

SpriteKey Player::spriteKey() const {
    switch(motion) {
    case MotionState::Jumping:
    case MotionState::DoubleJumping: return SpriteKey::PlayerJump;
    case MotionState::Ducking: return SpriteKey::PlayerDuck;
    case MotionState::Running: break;
    }
    return SpriteKey::PlayerRun;
}

void Player::setMotion(MotionState s) {
    if(s == motion) return;
    motion = s;
    frameIndex = 0;
    frameTimer = 0;
}

void Player::startJump(float velocity, SimContext &ctx) {
    bool first = grounded();
    vy = velocity;
    setMotion(first ? MotionState::Jumping : MotionState::DoubleJumping);
    if(first) {
        ctx.sounds.push_back(SoundEvent::Jump);
        ctx.particles.emit(ParticleKind::Dust, feet(), 3);
    } else {
        ctx.sounds.push_back(SoundEvent::DoubleJump);
        Vec2 mid{ tuning.x, groundY + height - currentHeight() * 0.5f };
        ctx.particles.emit(ParticleKind::Sparkle, mid, 5);
    }
}

void Player::handleInput(InputEvent e, SimContext &ctx) {
    if(isDefeated) return;
    switch(e) {
    case InputEvent::JumpPressed:
        if(grounded()) startJump(tuning.jumpVelocity, ctx);       // ducking stands up first
        else if(motion == MotionState::Jumping) startJump(tuning.doubleJumpVelocity, ctx);
        else bufferedJump = tuning.jumpBufferSeconds;               // fires on landing if still live
        break;
    case InputEvent::DuckPressed:
        if(motion == MotionState::Running) setMotion(MotionState::Ducking);
        break;
    case InputEvent::DuckReleased:
        if(motion == MotionState::Ducking) setMotion(MotionState::Running);
        break;
    default:
        break;
    }
}

void Player::update(float dt, SimContext &ctx) {
    if(isDefeated) return;

    if(airborne()) {
        height += vy * dt;
        vy += tuning.gravity * dt;
        if(height >= 0) {
            height = 0;
            vy = 0;
            setMotion(MotionState::Running);
            if(bufferedJump > 0) {
                bufferedJump = 0;
                startJump(tuning.jumpVelocity, ctx);
            }
        }
    }
    if(bufferedJump > 0) bufferedJump = max(0.0f, bufferedJump - dt);

    if(hasEffect) {
        effect.remaining -= dt;
        if(effect.remaining <= 0) {
            hasEffect = false;
            effect = ActivePowerUp();
        } else if(effect.kind == PowerUpKind::BlueDash) {
            trailTimer += dt;
            while(trailTimer >= tuning.dashTrailInterval) {
                trailTimer -= tuning.dashTrailInterval;
                Rect b = bounds();
                ctx.particles.emit(ParticleKind::DashTrail, Vec2{ b.x, b.y + b.h * 0.5f }, 1);
            }
        }
    }

    if(motion == MotionState::Running) {
        dustTimer += dt;
        if(dustTimer >= tuning.dustInterval) {
            dustTimer -= tuning.dustInterval;
            ctx.particles.emit(ParticleKind::Dust, feet(), 1);
        }
    } else {
        dustTimer = 0;
    }

    const AnimationSet &anim = ctx.assets.animation(spriteKey());
    if(anim.frameCount() > 1) {
        frameTimer += dt;
        while(frameTimer >= anim.frame(frameIndex).duration) {
            frameTimer -= anim.frame(frameIndex).duration;
            frameIndex = (frameIndex + 1) % anim.frameCount();
        }
    } else {
        frameIndex = 0;
    }
}

bool Player::applyPowerUp(PowerUpKind kind, SimContext &ctx) {
    if(isDefeated) return false;
    ctx.sounds.push_back(SoundEvent::PowerUp);
    Rect b = bounds();
    ctx.particles.emit(ParticleKind::Sparkle, Vec2{ b.x, b.y }, 10);
    if(kind == PowerUpKind::YellowTornado) return true;

    // A second dash extends the first, capped.
    if(hasEffect && effect.kind == PowerUpKind::BlueDash) {
        effect.remaining = min(effect.remaining + tuning.dashDuration, tuning.dashMaxDuration);
    } else {
        hasEffect = true;
        effect.kind = kind;
        effect.remaining = tuning.dashDuration;
        trailTimer = 0;
    }
    LOGI("blue dash active for %.2fs", effect.remaining);
    return false;
}

bool Player::takeHit(SimContext &ctx) {
    if(isDefeated || invincible()) return false;
    isDefeated = true;
    vy = 0;
    ctx.sounds.push_back(SoundEvent::Hit);
    return true;
}

} // namespace ronin
